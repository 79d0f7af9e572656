#include "pmsim/simulation/OutputRecorder.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <utility>

namespace pmsim {

OutputTable::OutputTable(std::vector<OutputRow> rows)
    : rows_(std::move(rows)) {}

const std::vector<std::string>& OutputTable::header() {
    static const std::vector<std::string> columns = {
        "day", "province_id", "S", "E", "I", "J3", "J4", "R",
        "cumulative_deaths", "hospital_occupied", "icu_occupied"};
    return columns;
}

std::vector<OutputRow> OutputTable::rowsForProvince(int provinceId) const {
    std::vector<OutputRow> result;
    for (const auto& row : rows_) {
        if (row.province_id == provinceId) result.push_back(row);
    }
    return result;
}

std::vector<OutputRow> OutputTable::rowsForDay(int day) const {
    std::vector<OutputRow> result;
    for (const auto& row : rows_) {
        if (row.day == day) result.push_back(row);
    }
    return result;
}

void OutputTable::writeCsv(std::ostream& out) const {
    const auto& columns = header();
    for (std::size_t i = 0; i < columns.size(); ++i) {
        out << (i ? "," : "") << columns[i];
    }
    out << '\n';
    for (const auto& r : rows_) {
        out << r.day << ',' << r.province_id << ','
            << r.S << ',' << r.E << ',' << r.I << ',' << r.J3 << ',' << r.J4 << ',' << r.R << ','
            << r.cumulative_deaths << ',' << r.hospital_occupied << ',' << r.icu_occupied << '\n';
    }
    if (!out) {
        throw FileIOException("OutputTable::writeCsv", "Failed to write output table.");
    }
}

void OutputRecorder::record(const std::vector<OutputRow>& rows, const DailySummary& summary) {
    if (finalized_) {
        PMSIM_THROW_SIMULATION_ERROR("OutputRecorder::record", "Cannot record after the table was finalized.");
    }
    lastDayStart_ = rows_.size();
    rows_.insert(rows_.end(), rows.begin(), rows.end());
    summaries_.push_back(summary);
}

std::vector<OutputRow> OutputRecorder::drainNew() {
    std::vector<OutputRow> fresh(rows_.begin() + static_cast<std::ptrdiff_t>(cursor_), rows_.end());
    cursor_ = rows_.size();
    return fresh;
}

std::vector<OutputRow> OutputRecorder::lastSnapshot() const {
    return std::vector<OutputRow>(rows_.begin() + static_cast<std::ptrdiff_t>(lastDayStart_), rows_.end());
}

void OutputRecorder::finalize() {
    if (finalized_) return;
    table_ = OutputTable(rows_);
    finalized_ = true;
}

const OutputTable& OutputRecorder::table() const {
    if (!finalized_) {
        PMSIM_THROW_SIMULATION_ERROR("OutputRecorder::table", "The output table is only available once the run has terminated.");
    }
    return table_;
}

void OutputRecorder::writeSummaryCsv(std::ostream& out) const {
    out << "day,new_exposures,new_infectious,new_deaths,prevalence,"
           "excess_hospital_demand,excess_icu_demand,moved,new_vaccinations\n";
    for (const auto& s : summaries_) {
        out << s.day << ',' << s.new_exposures << ',' << s.new_infectious << ',' << s.new_deaths << ','
            << s.prevalence << ',' << s.excess_hospital_demand << ',' << s.excess_icu_demand << ','
            << s.moved << ',' << s.new_vaccinations << '\n';
    }
    if (!out) {
        throw FileIOException("OutputRecorder::writeSummaryCsv", "Failed to write daily summary.");
    }
}

void OutputRecorder::discard() {
    rows_.clear();
    summaries_.clear();
    cursor_ = 0;
    lastDayStart_ = 0;
    table_ = OutputTable();
}

} // namespace pmsim
