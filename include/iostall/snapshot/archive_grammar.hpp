#pragma once

#include <tao/pegtl.hpp>

namespace iostall::snapshot::grammar {

namespace pegtl = tao::pegtl;

struct two_digits : pegtl::rep<2, pegtl::digit> {
};

struct year_part : pegtl::rep<4, pegtl::digit> {
};

struct month_part : two_digits {
};

struct day_part : two_digits {
};

struct hour_part : two_digits {
};

struct minute_part : two_digits {
};

struct second_part : two_digits {
};

struct millisecond_part : pegtl::rep<3, pegtl::digit> {
};

struct date_time_separator : pegtl::one<'T', 't', ' '> {
};

struct timestamp
    : pegtl::seq<year_part,
                 pegtl::one<'-'>,
                 month_part,
                 pegtl::one<'-'>,
                 day_part,
                 date_time_separator,
                 hour_part,
                 pegtl::one<':'>,
                 minute_part,
                 pegtl::one<':'>,
                 second_part,
                 pegtl::opt<pegtl::seq<pegtl::one<'.'>, millisecond_part>>,
                 pegtl::opt<pegtl::one<'Z', 'z'>>> {
};

struct timestamp_grammar : pegtl::seq<pegtl::star<pegtl::blank>, timestamp, pegtl::star<pegtl::blank>, pegtl::eof> {
};

struct separator : pegtl::one<','> {
};

struct quoted_char : pegtl::sor<pegtl::seq<pegtl::one<'"'>, pegtl::one<'"'>>, pegtl::not_one<'"', '\r', '\n'>> {
};

struct quoted_text : pegtl::seq<pegtl::one<'"'>, pegtl::star<quoted_char>, pegtl::one<'"'>> {
};

struct signed_integer : pegtl::seq<pegtl::opt<pegtl::one<'-'>>, pegtl::plus<pegtl::digit>> {
};

struct unsigned_integer : pegtl::plus<pegtl::digit> {
};

struct hex_digits : pegtl::rep_min_max<1, 16, pegtl::xdigit> {
};

struct hex_value : pegtl::seq<pegtl::one<'0'>, pegtl::one<'x', 'X'>, hex_digits> {
};

struct captured_at_field : timestamp {
};

struct database_id_field : signed_integer {
};

struct database_name_field : quoted_text {
};

struct file_id_field : signed_integer {
};

struct drive_field : quoted_text {
};

struct file_type_field : quoted_text {
};

struct physical_name_field : quoted_text {
};

struct reads_field : unsigned_integer {
};

struct writes_field : unsigned_integer {
};

struct read_stall_field : unsigned_integer {
};

struct write_stall_field : unsigned_integer {
};

struct total_stall_field : unsigned_integer {
};

struct bytes_read_field : unsigned_integer {
};

struct bytes_written_field : unsigned_integer {
};

struct file_handle_field : hex_value {
};

// must<> so that a failing field reports the column it failed at.
struct record
    : pegtl::must<captured_at_field,
                  separator,
                  database_id_field,
                  separator,
                  database_name_field,
                  separator,
                  file_id_field,
                  separator,
                  drive_field,
                  separator,
                  file_type_field,
                  separator,
                  physical_name_field,
                  separator,
                  reads_field,
                  separator,
                  writes_field,
                  separator,
                  read_stall_field,
                  separator,
                  write_stall_field,
                  separator,
                  total_stall_field,
                  separator,
                  bytes_read_field,
                  separator,
                  bytes_written_field,
                  separator,
                  file_handle_field,
                  pegtl::star<pegtl::blank>,
                  pegtl::eof> {
};

}  // namespace iostall::snapshot::grammar
