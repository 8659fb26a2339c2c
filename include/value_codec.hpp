#ifndef VALUE_CODEC_H
#define VALUE_CODEC_H

#include "register_types.hpp"
#include <cstdint>
#include <vector>

/**
 * @class ValueCodec
 * @brief Converts between raw register words and typed values.
 *
 * Both directions are pure functions of the descriptor, the words or value,
 * and the codec context. Multi-register integers follow the descriptor's word
 * order; scaled numbers are rounded half away from zero when encoded.
 */
class ValueCodec {
public:
    /**
     * @brief Decodes the registers covered by a descriptor.
     * @param descriptor The register descriptor.
     * @param words Exactly descriptor.length raw words, lowest address first.
     * @param context Device state such as the UTC offset for local timestamps.
     * @return The typed value with the descriptor's unit and scale.
     * @throw DecodeError if the word count is wrong or the content is outside the
     *        type's domain (unknown enumeration code, unrepresentable integer).
     */
    static TypedValue decode(const RegisterDescriptor& descriptor, const std::vector<uint16_t>& words,
                             const CodecContext& context = {});

    /**
     * @brief Encodes a value into the words to write at the descriptor's address.
     * @throw NotWritable if the descriptor is read-only.
     * @throw EncodeError if the value has the wrong kind or does not fit.
     */
    static std::vector<uint16_t> encode(const RegisterDescriptor& descriptor, const WriteValue& value,
                                        const CodecContext& context = {});

    /**
     * @brief Encodes without the writability check, for comparing read-back data.
     */
    static std::vector<uint16_t> encodeUnchecked(const RegisterDescriptor& descriptor, const WriteValue& value,
                                                 const CodecContext& context = {});
};

#endif // VALUE_CODEC_H
