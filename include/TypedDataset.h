#pragma once
#include "Record.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, DATETIME };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    bool isMissing(size_t row) const { return row >= missing.size() || missing[row] != 0; }
    size_t nonMissingCount() const;
};

class TypedDataset {
public:
    enum class DateLocaleHint {
        AUTO,
        DMY,
        MDY
    };

    TypedDataset() = default;
    explicit TypedDataset(DateLocaleHint hint) : dateLocaleHint_(hint) {}

    void setDateLocaleHint(DateLocaleHint hint) noexcept { dateLocaleHint_ = hint; }
    DateLocaleHint dateLocaleHint() const noexcept { return dateLocaleHint_; }

    /**
     * @brief Builds typed columns from raw records.
     * @details Columns follow first-seen field order. Each column is typed independently and
     *          all-or-nothing: numeric when every non-missing value parses as a number, else
     *          datetime when every non-missing value parses as a timestamp, else categorical.
     * @post rowIds() holds the input positions 0..records.size()-1.
     */
    void load(const std::vector<Record>& records);

    static TypedDataset fromRecords(const std::vector<Record>& records, DateLocaleHint hint = DateLocaleHint::AUTO);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    bool empty() const noexcept { return rowCount_ == 0 || columns_.empty(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    const std::vector<size_t>& rowIds() const noexcept { return rowIds_; }

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> datetimeColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Returns a new dataset holding the given columns and the rows where keepMask is set.
     * @pre keepMask.size() == rowCount().
     * @post Row identifiers of kept rows are preserved; this dataset is untouched.
     * @throws Nika::DatasetException when mask size mismatches row count or a column index is out of range.
     */
    TypedDataset select(const std::vector<size_t>& columnIndices, const MissingMask& keepMask) const;

    /**
     * @brief Renders typed values back into records (datetime as "YYYY-MM-DD HH:MM:SS").
     */
    std::vector<Record> toRecords() const;

    bool parseDouble(const RawScalar& v, double& out) const;
    bool parseDateTime(const RawScalar& v, int64_t& outUnixSeconds) const;

    static bool isMissingValue(const RawScalar& v);
    static std::string rawToText(const RawScalar& v);
    static std::string formatDateTime(int64_t unixSeconds);

private:
    DateLocaleHint dateLocaleHint_ = DateLocaleHint::AUTO;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
    std::vector<size_t> rowIds_;

    bool parseDateTimeText(const std::string& v, int64_t& outUnixSeconds) const;
};
