#ifndef PMSIM_OUTPUT_ROW_HPP
#define PMSIM_OUTPUT_ROW_HPP

namespace pmsim {

/**
 * @struct OutputRow
 * @brief Snapshot of one province at the end of one simulated day.
 *
 * Field order is the column order of the serialized table.
 */
struct OutputRow {
    int day = 0;
    int province_id = 0;
    long S = 0;
    long E = 0;
    long I = 0;
    long J3 = 0;
    long J4 = 0;
    long R = 0;
    long cumulative_deaths = 0;
    long hospital_occupied = 0;
    long icu_occupied = 0;

    /** @brief Living population plus cumulative deaths. */
    long accountedPopulation() const {
        return S + E + I + J3 + J4 + R + cumulative_deaths;
    }

    bool operator==(const OutputRow& other) const {
        return day == other.day && province_id == other.province_id &&
               S == other.S && E == other.E && I == other.I &&
               J3 == other.J3 && J4 == other.J4 && R == other.R &&
               cumulative_deaths == other.cumulative_deaths &&
               hospital_occupied == other.hospital_occupied &&
               icu_occupied == other.icu_occupied;
    }

    bool operator!=(const OutputRow& other) const { return !(*this == other); }
};

} // namespace pmsim

#endif // PMSIM_OUTPUT_ROW_HPP
