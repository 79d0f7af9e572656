#ifndef PMSIM_OUTPUT_RECORDER_HPP
#define PMSIM_OUTPUT_RECORDER_HPP

#include "pmsim/model/ModelConstants.hpp"
#include "pmsim/simulation/OutputRow.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace pmsim {

/**
 * @struct DailySummary
 * @brief Network-wide figures of one simulated day.
 */
struct DailySummary {
    int day = 0;
    long new_exposures = 0;
    long new_infectious = 0;
    long new_deaths = 0;
    /** @brief E + I + J3 + J4 at the end of the day */
    long prevalence = 0;
    long excess_hospital_demand = 0;
    long excess_icu_demand = 0;
    /** @brief Individuals who changed province */
    long moved = 0;
    long new_vaccinations = 0;
};

/**
 * @class OutputTable
 * @brief Finished time series: one row per (day, province), ordered by day then province.
 */
class OutputTable {
public:
    /** @brief Version of the row schema written by writeCsv(). */
    static constexpr int SCHEMA_VERSION = constants::OUTPUT_SCHEMA_VERSION;

    OutputTable() = default;
    explicit OutputTable(std::vector<OutputRow> rows);

    /** @brief Column names, in serialization order. */
    static const std::vector<std::string>& header();

    const std::vector<OutputRow>& rows() const { return rows_; }
    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    /** @brief Rows of one province, ordered by day. */
    std::vector<OutputRow> rowsForProvince(int provinceId) const;

    /** @brief Rows of one day, ordered by province. */
    std::vector<OutputRow> rowsForDay(int day) const;

    /** @brief Last simulated day, 0 for an empty table. */
    int lastDay() const { return rows_.empty() ? 0 : rows_.back().day; }

    /**
     * @brief Writes the header line and one line per row.
     * @throws FileIOException if the stream fails.
     */
    void writeCsv(std::ostream& out) const;

private:
    std::vector<OutputRow> rows_;
};

/**
 * @class OutputRecorder
 * @brief Collects the daily snapshots of a run.
 *
 * While the run is in progress, new rows are consumed through drainNew().
 * Once finalized, the materialized table is available through table().
 */
class OutputRecorder {
public:
    /**
     * @brief Appends one day: a row per province and the day's summary.
     * @throws SimulationException after finalize().
     */
    void record(const std::vector<OutputRow>& rows, const DailySummary& summary);

    /**
     * @brief Rows recorded since the previous call.
     *
     * The cursor only moves forward; rows are never returned twice.
     */
    std::vector<OutputRow> drainNew();

    /** @brief Rows of the most recent recorded day, empty before the first. */
    std::vector<OutputRow> lastSnapshot() const;

    /** @brief Marks the recording complete. */
    void finalize();
    bool isFinalized() const { return finalized_; }

    /**
     * @brief The finished table.
     * @throws SimulationException before finalize().
     */
    const OutputTable& table() const;

    const std::vector<DailySummary>& summaries() const { return summaries_; }

    /** @brief Writes the daily summaries as CSV. */
    void writeSummaryCsv(std::ostream& out) const;

    /** @brief Drops everything recorded so far. */
    void discard();

    std::size_t rowCount() const { return rows_.size(); }

private:
    std::vector<OutputRow> rows_;
    std::vector<DailySummary> summaries_;
    std::size_t cursor_ = 0;
    std::size_t lastDayStart_ = 0;
    bool finalized_ = false;
    OutputTable table_;
};

} // namespace pmsim

#endif // PMSIM_OUTPUT_RECORDER_HPP
