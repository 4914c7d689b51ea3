#pragma once
#include <chronicle/schema/batch_record.hpp>
#include <chronicle/schema/digest_record.hpp>
#include <chronicle/schema/primitives.hpp>
#include <optional>

// Stored row codecs. Records travel as flat SCALE tuples; enum fields are
// narrowed to their underlying integer.
namespace chronicle::schema::encoding::scale {

chronicle::schema::bytes_t encode_digest_record(
    const chronicle::schema::digest_record_t& record);
std::optional<chronicle::schema::digest_record_t> decode_digest_record(
    const chronicle::schema::bytes_view_t& bytes);

chronicle::schema::bytes_t encode_batch_record(
    const chronicle::schema::batch_record_t& record);
std::optional<chronicle::schema::batch_record_t> decode_batch_record(
    const chronicle::schema::bytes_view_t& bytes);

}  // namespace chronicle::schema::encoding::scale
