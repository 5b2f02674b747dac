#include "record.h"
#include "base32.h"
#include "bencode.h"
#include "logger.h"
#include <cstdio>
#include <cstdint>

#define LOG_RECORD_DEBUG(message) LOG_DEBUG("record", message)

namespace kaddht {

namespace {

const char* FIELD_KEY = "key";
const char* FIELD_VALUE = "value";
const char* FIELD_TIME_RECEIVED = "timeReceived";

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

bool read_digits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string encode_record(const Record& record) {
    BencodeValue dict = BencodeValue::create_dict();
    dict[FIELD_KEY] = BencodeValue(record.key);
    dict[FIELD_VALUE] = BencodeValue(record.value);
    if (!record.time_received.empty()) {
        dict[FIELD_TIME_RECEIVED] = BencodeValue(record.time_received);
    }
    return dict.encode_string();
}

std::optional<Record> decode_record(const std::string& data) {
    try {
        const BencodeValue dict = BencodeDecoder::decode(data);
        if (!dict.is_dict()) {
            LOG_RECORD_DEBUG("Record blob is not a dictionary");
            return std::nullopt;
        }

        Record record;
        record.key = dict[FIELD_KEY].as_string();
        record.value = dict[FIELD_VALUE].as_string();
        if (const BencodeValue* received = dict.find(FIELD_TIME_RECEIVED)) {
            record.time_received = received->as_string();
        }
        return record;
    } catch (const BencodeError& e) {
        LOG_RECORD_DEBUG("Failed to decode record: " << e.what());
        return std::nullopt;
    }
}

void clean_record(Record& record) {
    record.time_received.clear();
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    auto since_epoch = duration_cast<nanoseconds>(tp.time_since_epoch());
    int64_t total_ns = since_epoch.count();
    int64_t secs = total_ns / 1000000000;
    int64_t nanos = total_ns % 1000000000;
    if (nanos < 0) {
        nanos += 1000000000;
        secs -= 1;
    }

    int64_t days = secs / 86400;
    int64_t sod = secs % 86400;
    if (sod < 0) {
        sod += 86400;
        days -= 1;
    }

    int64_t year;
    unsigned month, day;
    civil_from_days(days, year, month, day);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02d",
                  static_cast<long long>(year), month, day,
                  static_cast<int>(sod / 3600), static_cast<int>((sod / 60) % 60), static_cast<int>(sod % 60));
    std::string result(buffer);

    if (nanos != 0) {
        char fraction[16];
        std::snprintf(fraction, sizeof(fraction), "%09lld", static_cast<long long>(nanos));
        std::string digits(fraction);
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        result += "." + digits;
    }

    result += "Z";
    return result;
}

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text) {
    // 2006-01-02T15:04:05[.999999999](Z|+hh:mm|-hh:mm)
    int year, month, day, hour, minute, second;
    if (text.size() < 20 ||
        !read_digits(text, 0, 4, year) || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' ||
        !read_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' ||
        !read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits >= 9) {
                return std::nullopt;
            }
            nanos = nanos * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    int64_t offset_seconds = 0;
    if (pos >= text.size()) {
        return std::nullopt;
    }
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int sign = text[pos] == '-' ? -1 : 1;
        int off_hour, off_minute;
        if (!read_digits(text, pos + 1, 2, off_hour) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !read_digits(text, pos + 4, 2, off_minute) || off_hour > 23 || off_minute > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * (off_hour * 3600 + off_minute * 60);
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t secs = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
                 + hour * 3600 + minute * 60 + second - offset_seconds;

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

bool is_record_stale(const Record& record,
                     std::chrono::system_clock::time_point now,
                     std::chrono::system_clock::duration max_age) {
    auto received = parse_rfc3339(record.time_received);
    if (!received) {
        LOG_RECORD_DEBUG("Record has no valid receive time: '" << record.time_received << "'");
        return true;
    }
    return now - *received > max_age;
}

std::string datastore_key_for(const std::string& dht_key) {
    return "/" + base32_encode(dht_key);
}

std::optional<std::string> dht_key_from_datastore_key(const std::string& ds_key) {
    if (ds_key.empty() || ds_key[0] != '/') {
        return std::nullopt;
    }
    return base32_decode(ds_key.substr(1));
}

} // namespace kaddht
