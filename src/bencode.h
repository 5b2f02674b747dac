#pragma once

#include "kaddht_export.h"
#include <vector>
#include <string>
#include <map>
#include <cstdint>
#include <variant>
#include <stdexcept>

namespace kaddht {

class BencodeValue;
// Ordered so that encoding is canonical without a sort pass
using BencodeDict = std::map<std::string, BencodeValue>;
using BencodeList = std::vector<BencodeValue>;

/**
 * Thrown by the decoder on malformed input and by accessors on type mismatch
 */
class KADDHT_API BencodeError : public std::runtime_error {
public:
    explicit BencodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A bencoded value: signed 64-bit integer, byte string, list or dictionary.
 */
class KADDHT_API BencodeValue {
public:
    enum class Type {
        Integer,
        String,
        List,
        Dictionary
    };

    BencodeValue();
    BencodeValue(int64_t value);
    BencodeValue(const std::string& value);
    BencodeValue(const char* value);
    BencodeValue(const BencodeList& value);
    BencodeValue(const BencodeDict& value);

    Type get_type() const { return type_; }
    bool is_integer() const { return type_ == Type::Integer; }
    bool is_string() const { return type_ == Type::String; }
    bool is_list() const { return type_ == Type::List; }
    bool is_dict() const { return type_ == Type::Dictionary; }

    int64_t as_integer() const;
    const std::string& as_string() const;
    const BencodeList& as_list() const;
    const BencodeDict& as_dict() const;

    BencodeList& as_list();
    BencodeDict& as_dict();

    // Dictionary operations
    bool has_key(const std::string& key) const;
    const BencodeValue* find(const std::string& key) const;
    const BencodeValue& operator[](const std::string& key) const;
    BencodeValue& operator[](const std::string& key);

    void push_back(const BencodeValue& value);
    size_t size() const;

    std::vector<uint8_t> encode() const;
    std::string encode_string() const;

    static BencodeValue create_list();
    static BencodeValue create_dict();

private:
    Type type_;
    std::variant<int64_t, std::string, BencodeList, BencodeDict> value_;

    void encode_to_buffer(std::vector<uint8_t>& buffer) const;
};

/**
 * Strict bencode decoder. The whole input must be exactly one value.
 */
class KADDHT_API BencodeDecoder {
public:
    static constexpr size_t MAX_DEPTH = 64;

    static BencodeValue decode(const std::vector<uint8_t>& data);
    static BencodeValue decode(const std::string& data);
    static BencodeValue decode(const uint8_t* data, size_t size);

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    size_t depth_;

    BencodeDecoder(const uint8_t* data, size_t size);

    BencodeValue decode_value();
    BencodeValue decode_integer();
    BencodeValue decode_string();
    BencodeValue decode_list();
    BencodeValue decode_dict();

    bool has_more() const { return pos_ < size_; }
    uint8_t current_byte() const;
    uint8_t consume_byte();
    std::string consume_string(size_t length);
};

} // namespace kaddht
