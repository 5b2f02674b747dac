#include "bencode.h"
#include <limits>

namespace kaddht {

BencodeValue::BencodeValue() : type_(Type::String), value_(std::string()) {}

BencodeValue::BencodeValue(int64_t value) : type_(Type::Integer), value_(value) {}

BencodeValue::BencodeValue(const std::string& value) : type_(Type::String), value_(value) {}

BencodeValue::BencodeValue(const char* value) : type_(Type::String), value_(std::string(value)) {}

BencodeValue::BencodeValue(const BencodeList& value) : type_(Type::List), value_(value) {}

BencodeValue::BencodeValue(const BencodeDict& value) : type_(Type::Dictionary), value_(value) {}

int64_t BencodeValue::as_integer() const {
    if (type_ != Type::Integer) {
        throw BencodeError("BencodeValue is not an integer");
    }
    return std::get<int64_t>(value_);
}

const std::string& BencodeValue::as_string() const {
    if (type_ != Type::String) {
        throw BencodeError("BencodeValue is not a string");
    }
    return std::get<std::string>(value_);
}

const BencodeList& BencodeValue::as_list() const {
    if (type_ != Type::List) {
        throw BencodeError("BencodeValue is not a list");
    }
    return std::get<BencodeList>(value_);
}

const BencodeDict& BencodeValue::as_dict() const {
    if (type_ != Type::Dictionary) {
        throw BencodeError("BencodeValue is not a dictionary");
    }
    return std::get<BencodeDict>(value_);
}

BencodeList& BencodeValue::as_list() {
    if (type_ != Type::List) {
        throw BencodeError("BencodeValue is not a list");
    }
    return std::get<BencodeList>(value_);
}

BencodeDict& BencodeValue::as_dict() {
    if (type_ != Type::Dictionary) {
        throw BencodeError("BencodeValue is not a dictionary");
    }
    return std::get<BencodeDict>(value_);
}

bool BencodeValue::has_key(const std::string& key) const {
    return find(key) != nullptr;
}

const BencodeValue* BencodeValue::find(const std::string& key) const {
    if (type_ != Type::Dictionary) {
        return nullptr;
    }
    const auto& dict = std::get<BencodeDict>(value_);
    auto it = dict.find(key);
    return it == dict.end() ? nullptr : &it->second;
}

const BencodeValue& BencodeValue::operator[](const std::string& key) const {
    const BencodeValue* value = find(key);
    if (!value) {
        throw BencodeError("Key not found in dictionary: " + key);
    }
    return *value;
}

BencodeValue& BencodeValue::operator[](const std::string& key) {
    return as_dict()[key];
}

void BencodeValue::push_back(const BencodeValue& value) {
    as_list().push_back(value);
}

size_t BencodeValue::size() const {
    switch (type_) {
        case Type::String:
            return std::get<std::string>(value_).size();
        case Type::List:
            return std::get<BencodeList>(value_).size();
        case Type::Dictionary:
            return std::get<BencodeDict>(value_).size();
        default:
            throw BencodeError("Size not applicable to this type");
    }
}

std::vector<uint8_t> BencodeValue::encode() const {
    std::vector<uint8_t> buffer;
    encode_to_buffer(buffer);
    return buffer;
}

std::string BencodeValue::encode_string() const {
    auto buffer = encode();
    return std::string(buffer.begin(), buffer.end());
}

static void append_string(std::vector<uint8_t>& buffer, const std::string& str) {
    std::string len_str = std::to_string(str.size()) + ":";
    buffer.insert(buffer.end(), len_str.begin(), len_str.end());
    buffer.insert(buffer.end(), str.begin(), str.end());
}

void BencodeValue::encode_to_buffer(std::vector<uint8_t>& buffer) const {
    switch (type_) {
        case Type::Integer: {
            std::string str = "i" + std::to_string(std::get<int64_t>(value_)) + "e";
            buffer.insert(buffer.end(), str.begin(), str.end());
            break;
        }
        case Type::String:
            append_string(buffer, std::get<std::string>(value_));
            break;
        case Type::List: {
            buffer.push_back('l');
            for (const auto& item : std::get<BencodeList>(value_)) {
                item.encode_to_buffer(buffer);
            }
            buffer.push_back('e');
            break;
        }
        case Type::Dictionary: {
            buffer.push_back('d');
            for (const auto& pair : std::get<BencodeDict>(value_)) {
                append_string(buffer, pair.first);
                pair.second.encode_to_buffer(buffer);
            }
            buffer.push_back('e');
            break;
        }
    }
}

BencodeValue BencodeValue::create_list() {
    return BencodeValue(BencodeList());
}

BencodeValue BencodeValue::create_dict() {
    return BencodeValue(BencodeDict());
}

// BencodeDecoder implementation
BencodeDecoder::BencodeDecoder(const uint8_t* data, size_t size)
    : data_(data), size_(size), pos_(0), depth_(0) {}

BencodeValue BencodeDecoder::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

BencodeValue BencodeDecoder::decode(const std::string& data) {
    return decode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

BencodeValue BencodeDecoder::decode(const uint8_t* data, size_t size) {
    BencodeDecoder decoder(data, size);
    BencodeValue value = decoder.decode_value();
    if (decoder.has_more()) {
        throw BencodeError("Trailing data after bencoded value");
    }
    return value;
}

BencodeValue BencodeDecoder::decode_value() {
    uint8_t first_byte = current_byte();

    if (first_byte == 'i') {
        return decode_integer();
    } else if (first_byte == 'l') {
        return decode_list();
    } else if (first_byte == 'd') {
        return decode_dict();
    } else if (first_byte >= '0' && first_byte <= '9') {
        return decode_string();
    }
    throw BencodeError("Invalid bencode data");
}

BencodeValue BencodeDecoder::decode_integer() {
    consume_byte();  // 'i'

    bool negative = false;
    if (current_byte() == '-') {
        negative = true;
        consume_byte();
    }

    std::string digits;
    while (current_byte() != 'e') {
        uint8_t c = consume_byte();
        if (c < '0' || c > '9') {
            throw BencodeError("Invalid character in integer");
        }
        digits += static_cast<char>(c);
    }
    consume_byte();  // 'e'

    if (digits.empty()) {
        throw BencodeError("Empty integer");
    }
    if (digits.size() > 1 && digits[0] == '0') {
        throw BencodeError("Leading zero in integer");
    }
    if (negative && digits == "0") {
        throw BencodeError("Negative zero");
    }

    // Accumulate as unsigned so INT64_MIN is representable
    uint64_t magnitude = 0;
    const uint64_t limit = negative
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
        : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    for (char c : digits) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            throw BencodeError("Integer out of range");
        }
        magnitude = magnitude * 10 + digit;
    }

    if (negative) {
        return BencodeValue(static_cast<int64_t>(0 - magnitude));
    }
    return BencodeValue(static_cast<int64_t>(magnitude));
}

BencodeValue BencodeDecoder::decode_string() {
    size_t length = 0;
    size_t digit_count = 0;
    while (current_byte() != ':') {
        uint8_t c = consume_byte();
        if (c < '0' || c > '9') {
            throw BencodeError("Invalid character in string length");
        }
        if (digit_count > 0 && length == 0) {
            throw BencodeError("Leading zero in string length");
        }
        if (length > (size_ - pos_)) {
            throw BencodeError("String length exceeds data size");
        }
        length = length * 10 + static_cast<size_t>(c - '0');
        ++digit_count;
    }
    consume_byte();  // ':'

    return BencodeValue(consume_string(length));
}

BencodeValue BencodeDecoder::decode_list() {
    consume_byte();  // 'l'
    if (++depth_ > MAX_DEPTH) {
        throw BencodeError("Nesting too deep");
    }

    BencodeValue list = BencodeValue::create_list();
    while (current_byte() != 'e') {
        list.push_back(decode_value());
    }
    consume_byte();

    --depth_;
    return list;
}

BencodeValue BencodeDecoder::decode_dict() {
    consume_byte();  // 'd'
    if (++depth_ > MAX_DEPTH) {
        throw BencodeError("Nesting too deep");
    }

    BencodeValue dict = BencodeValue::create_dict();
    auto& entries = dict.as_dict();
    while (current_byte() != 'e') {
        if (current_byte() < '0' || current_byte() > '9') {
            throw BencodeError("Dictionary key must be a string");
        }
        std::string key = decode_string().as_string();
        BencodeValue value = decode_value();
        if (!entries.emplace(std::move(key), std::move(value)).second) {
            throw BencodeError("Duplicate dictionary key");
        }
    }
    consume_byte();

    --depth_;
    return dict;
}

uint8_t BencodeDecoder::current_byte() const {
    if (pos_ >= size_) {
        throw BencodeError("Unexpected end of data");
    }
    return data_[pos_];
}

uint8_t BencodeDecoder::consume_byte() {
    if (pos_ >= size_) {
        throw BencodeError("Unexpected end of data");
    }
    return data_[pos_++];
}

std::string BencodeDecoder::consume_string(size_t length) {
    if (length > size_ - pos_) {
        throw BencodeError("String length exceeds data size");
    }
    std::string str(reinterpret_cast<const char*>(data_ + pos_), length);
    pos_ += length;
    return str;
}

} // namespace kaddht
