#include "TypedDataset.h"
#include "CommonUtils.h"
#include "NikaExceptions.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(std::move(s));
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (len == 0 || offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
    year = static_cast<int>(y);
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

// Accepts "", HH:MM, HH:MM:SS and HH:MM:SS.fff, each with an optional trailing 'Z'.
bool parseTimePart(std::string timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (!timePart.empty() && (timePart.back() == 'Z' || timePart.back() == 'z')) {
        timePart.pop_back();
    }
    if (timePart.empty()) return true;

    if (timePart.size() < 5) return false;
    if (!parseFixedInt(timePart, 0, 2, hour) || timePart[2] != ':' || !parseFixedInt(timePart, 3, 2, minute)) {
        return false;
    }
    if (timePart.size() == 5) return true;
    if (timePart.size() < 8 || timePart[5] != ':' || !parseFixedInt(timePart, 6, 2, second)) return false;
    if (timePart.size() == 8) return true;

    if (timePart[8] != '.' || timePart.size() == 9) return false;
    for (size_t i = 9; i < timePart.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(timePart[i]))) return false;
    }
    return true;
}

// Splits "a<sep>b<sep>c" into three all-digit parts; rejects anything else.
bool splitDateParts(const std::string& s, char sep, std::string& a, std::string& b, std::string& c) {
    const size_t p1 = s.find(sep);
    if (p1 == std::string::npos) return false;
    const size_t p2 = s.find(sep, p1 + 1);
    if (p2 == std::string::npos || s.find(sep, p2 + 1) != std::string::npos) return false;
    a = s.substr(0, p1);
    b = s.substr(p1 + 1, p2 - p1 - 1);
    c = s.substr(p2 + 1);
    auto allDigits = [](const std::string& part) {
        return !part.empty() && std::all_of(part.begin(), part.end(), [](unsigned char ch) { return std::isdigit(ch); });
    };
    return allDigits(a) && allDigits(b) && allDigits(c);
}

bool parseDatePart(const std::string& datePart, TypedDataset::DateLocaleHint localeHint, int& year, int& month, int& day) {
    // ISO week date: YYYY-Www-D (D:1..7)
    if (datePart.size() == 10 && datePart[4] == '-' && datePart[5] == 'W' && datePart[8] == '-') {
        int isoYear = 0;
        int isoWeek = 0;
        int isoDay = 0;
        if (!parseFixedInt(datePart, 0, 4, isoYear) ||
            !parseFixedInt(datePart, 6, 2, isoWeek) ||
            !parseFixedInt(datePart, 9, 1, isoDay)) {
            return false;
        }
        if (isoWeek < 1 || isoWeek > 53 || isoDay < 1 || isoDay > 7) return false;

        const int64_t jan4 = daysFromCivil(isoYear, 1, 4);
        const int jan4WeekdayMon1 = static_cast<int>(((jan4 + 3) % 7 + 7) % 7) + 1;
        const int64_t isoWeek1Monday = jan4 - static_cast<int64_t>(jan4WeekdayMon1 - 1);
        const int64_t targetDays = isoWeek1Monday + static_cast<int64_t>((isoWeek - 1) * 7 + (isoDay - 1));
        civilFromDays(targetDays, year, month, day);
        return true;
    }

    std::string a;
    std::string b;
    std::string c;
    if (splitDateParts(datePart, '-', a, b, c)) {
        // ISO: YYYY-MM-DD
        if (a.size() == 4 && b.size() <= 2 && c.size() <= 2) {
            return parseFixedInt(a, 0, 4, year) && parseFixedInt(b, 0, b.size(), month) && parseFixedInt(c, 0, c.size(), day);
        }
        // DMY: DD-MM-YYYY
        if (a.size() == 2 && b.size() == 2 && c.size() == 4) {
            return parseFixedInt(a, 0, 2, day) && parseFixedInt(b, 0, 2, month) && parseFixedInt(c, 0, 4, year);
        }
        // MDY two-digit year: MM-DD-YY
        if (a.size() == 2 && b.size() == 2 && c.size() == 2) {
            int yy = 0;
            if (!parseFixedInt(a, 0, 2, month) || !parseFixedInt(b, 0, 2, day) || !parseFixedInt(c, 0, 2, yy)) {
                return false;
            }
            year = (yy >= 70) ? (1900 + yy) : (2000 + yy);
            return true;
        }
        return false;
    }

    if (splitDateParts(datePart, '/', a, b, c)) {
        // YYYY/MM/DD
        if (a.size() == 4 && b.size() <= 2 && c.size() <= 2) {
            return parseFixedInt(a, 0, 4, year) && parseFixedInt(b, 0, b.size(), month) && parseFixedInt(c, 0, c.size(), day);
        }
        if (a.size() > 2 || b.size() > 2 || c.size() != 4) return false;

        // dd/mm/yyyy or mm/dd/yyyy based on locale hint.
        int first = 0;
        int second = 0;
        if (!parseFixedInt(a, 0, a.size(), first) ||
            !parseFixedInt(b, 0, b.size(), second) ||
            !parseFixedInt(c, 0, 4, year)) {
            return false;
        }
        if (localeHint == TypedDataset::DateLocaleHint::DMY) {
            day = first;
            month = second;
        } else if (localeHint == TypedDataset::DateLocaleHint::MDY) {
            month = first;
            day = second;
        } else if (first > 12 && second <= 12) {
            day = first;
            month = second;
        } else {
            month = first;
            day = second;
        }
        return true;
    }

    return false;
}

bool parseStrictDouble(const std::string& raw, double& out) {
    std::string cleaned = CommonUtils::trim(raw);
    if (!cleaned.empty() && cleaned.front() == '+') {
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}
}

size_t TypedColumn::nonMissingCount() const {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(0)));
}

bool TypedDataset::isMissingValue(const RawScalar& v) {
    if (isNull(v)) return true;
    if (const auto* s = std::get_if<std::string>(&v)) return isMissingToken(*s);
    if (const auto* d = std::get_if<double>(&v)) return std::isnan(*d);
    return false;
}

std::string TypedDataset::rawToText(const RawScalar& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const auto* d = std::get_if<double>(&v)) {
        std::ostringstream out;
        out << std::setprecision(15) << *d;
        return out.str();
    }
    return "";
}

std::string TypedDataset::formatDateTime(int64_t unixSeconds) {
    int64_t days = unixSeconds / 86400;
    int64_t rem = unixSeconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, month, day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return buffer;
}

bool TypedDataset::parseDouble(const RawScalar& v, double& out) const {
    if (isMissingValue(v)) return false;
    if (const auto* d = std::get_if<double>(&v)) {
        out = *d;
        return std::isfinite(out);
    }
    if (const auto* s = std::get_if<std::string>(&v)) return parseStrictDouble(*s, out);
    return false;
}

bool TypedDataset::parseDateTime(const RawScalar& v, int64_t& outUnixSeconds) const {
    if (isMissingValue(v)) return false;
    const auto* s = std::get_if<std::string>(&v);
    if (s == nullptr) return false;
    return parseDateTimeText(*s, outUnixSeconds);
}

bool TypedDataset::parseDateTimeText(const std::string& v, int64_t& outUnixSeconds) const {
    std::string s = CommonUtils::trim(v);
    if (s.empty() || isMissingToken(s)) return false;

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    std::string datePart = s;
    std::string timePart;
    size_t sep = s.find(' ');
    if (sep == std::string::npos) {
        sep = s.find('T');
    }
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = CommonUtils::trim(s.substr(sep + 1));
    }

    if (!parseDatePart(datePart, dateLocaleHint_, year, month, day)) {
        return false;
    }
    if (!parseTimePart(timePart, hour, minute, second)) {
        return false;
    }

    if (month < 1 || month > 12) return false;
    const int dim = daysInMonth(year, month);
    if (day < 1 || day > dim) return false;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

void TypedDataset::load(const std::vector<Record>& records) {
    columns_.clear();
    rowCount_ = records.size();
    rowIds_.resize(rowCount_);
    for (size_t r = 0; r < rowCount_; ++r) rowIds_[r] = r;

    std::vector<std::string> header;
    std::unordered_map<std::string, size_t> headerIndex;
    for (const auto& record : records) {
        for (const auto& field : record) {
            if (headerIndex.emplace(field.name, header.size()).second) {
                header.push_back(field.name);
            }
        }
    }

    // Raw cells per column; nullptr marks an absent field.
    std::vector<std::vector<const RawScalar*>> cells(header.size(), std::vector<const RawScalar*>(rowCount_, nullptr));
    for (size_t r = 0; r < rowCount_; ++r) {
        for (const auto& field : records[r]) {
            const size_t c = headerIndex.at(field.name);
            if (cells[c][r] == nullptr) cells[c][r] = &field.value;
        }
    }

    columns_.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        TypedColumn col;
        col.name = header[c];
        col.missing.assign(rowCount_, static_cast<uint8_t>(0));
        for (size_t r = 0; r < rowCount_; ++r) {
            if (cells[c][r] == nullptr || isMissingValue(*cells[c][r])) {
                col.missing[r] = static_cast<uint8_t>(1);
            }
        }

        std::vector<double> numericValues(rowCount_, std::numeric_limits<double>::quiet_NaN());
        bool allNumeric = true;
        for (size_t r = 0; r < rowCount_ && allNumeric; ++r) {
            if (col.missing[r]) continue;
            allNumeric = parseDouble(*cells[c][r], numericValues[r]);
        }
        if (allNumeric) {
            col.type = ColumnType::NUMERIC;
            col.values = std::move(numericValues);
            columns_.push_back(std::move(col));
            continue;
        }

        std::vector<int64_t> datetimeValues(rowCount_, 0);
        bool allDatetime = true;
        for (size_t r = 0; r < rowCount_ && allDatetime; ++r) {
            if (col.missing[r]) continue;
            allDatetime = parseDateTime(*cells[c][r], datetimeValues[r]);
        }
        if (allDatetime) {
            col.type = ColumnType::DATETIME;
            col.values = std::move(datetimeValues);
            columns_.push_back(std::move(col));
            continue;
        }

        std::vector<std::string> categoricalValues(rowCount_);
        for (size_t r = 0; r < rowCount_; ++r) {
            if (col.missing[r]) continue;
            categoricalValues[r] = rawToText(*cells[c][r]);
        }
        col.type = ColumnType::CATEGORICAL;
        col.values = std::move(categoricalValues);
        columns_.push_back(std::move(col));
    }
}

TypedDataset TypedDataset::fromRecords(const std::vector<Record>& records, DateLocaleHint hint) {
    TypedDataset data(hint);
    data.load(records);
    return data;
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::datetimeColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::DATETIME) out.push_back(i);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

TypedDataset TypedDataset::select(const std::vector<size_t>& columnIndices, const MissingMask& keepMask) const {
    if (keepMask.size() != rowCount_) throw Nika::DatasetException("Row mask size mismatch");

    TypedDataset out(dateLocaleHint_);
    for (size_t i = 0; i < rowCount_; ++i) {
        if (keepMask[i]) out.rowIds_.push_back(rowIds_[i]);
    }
    out.rowCount_ = out.rowIds_.size();

    out.columns_.reserve(columnIndices.size());
    for (size_t idx : columnIndices) {
        if (idx >= columns_.size()) throw Nika::DatasetException("Column index out of range: " + std::to_string(idx));
        const TypedColumn& src = columns_[idx];

        TypedColumn col;
        col.name = src.name;
        col.type = src.type;
        col.missing.reserve(out.rowCount_);
        std::visit([&](const auto& values) {
            using VecT = std::decay_t<decltype(values)>;
            VecT next;
            next.reserve(out.rowCount_);
            for (size_t i = 0; i < rowCount_; ++i) {
                if (!keepMask[i]) continue;
                next.push_back(values[i]);
                col.missing.push_back(src.missing[i]);
            }
            col.values = std::move(next);
        }, src.values);
        out.columns_.push_back(std::move(col));
    }
    return out;
}

std::vector<Record> TypedDataset::toRecords() const {
    std::vector<Record> out(rowCount_);
    for (size_t r = 0; r < rowCount_; ++r) {
        Record& record = out[r];
        record.reserve(columns_.size());
        for (const auto& col : columns_) {
            RecordField field;
            field.name = col.name;
            if (!col.isMissing(r)) {
                if (col.type == ColumnType::NUMERIC) {
                    field.value = std::get<std::vector<double>>(col.values)[r];
                } else if (col.type == ColumnType::DATETIME) {
                    field.value = formatDateTime(std::get<std::vector<int64_t>>(col.values)[r]);
                } else {
                    field.value = std::get<std::vector<std::string>>(col.values)[r];
                }
            }
            record.push_back(std::move(field));
        }
    }
    return out;
}
