#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace suf
{
    enum class Season : uint8_t
    {
        Winter,
        Spring,
        Summer,
        Fall,
    };

    [[nodiscard]] Season           seasonOf(int month);
    [[nodiscard]] std::string_view toString(Season s);

    /**
     * Read-only view of the world for one tick. Built once per tick before any
     * organism acts.
     */
    struct TickContext
    {
        int    step  = 0;
        int    hour  = 0;
        int    day   = 1;
        int    month = 1;
        int    year  = 2000;
        double burrowTemperature = 0.0;
        double openTemperature   = 0.0;
    };

    struct ThermalRecord
    {
        int    year   = 2000;
        int    month  = 1;
        int    day    = 1;
        int    hour   = 0;
        int    minute = 0;
        int    second = 0;
        double open   = 0.0;
        double burrow = 0.0;
    };

    // Hourly burrow/open temperature series indexed by tick.
    class Landscape
    {
        public:
            Landscape() = default;

            explicit Landscape(std::vector<ThermalRecord> records): m_records(std::move(records))
            {
            }

            /**
             * Loads a thermal profile CSV with a `datetime` column (%Y-%m-%d %H:%M:%S) and the
             * named open/burrow temperature columns.
             * @throws ConfigError on unreadable files, missing columns or malformed rows
             */
            static Landscape fromCsv(const std::filesystem::path &path, const std::string &openColumn,
                                     const std::string &burrowColumn);

            static Landscape parseCsv(std::string_view text, const std::string &openColumn,
                                      const std::string &burrowColumn);

            [[nodiscard]] size_t stepCount() const
            {
                return m_records.size();
            }

            // @throws std::out_of_range past the end of the series
            [[nodiscard]] TickContext contextAt(size_t step) const;

            // Rows falling within 365 days of the first timestamp.
            [[nodiscard]] size_t stepsInOneYear() const;

            [[nodiscard]] const std::vector<ThermalRecord> &records() const
            {
                return m_records;
            }

        private:
            std::vector<ThermalRecord> m_records;
    };

    // Calendar days (month, day) on which organisms bruminate.
    class BrumationCalendar
    {
        public:
            BrumationCalendar() = default;

            BrumationCalendar(std::string site, std::set<std::pair<int, int>> days): m_site(std::move(site)),
                m_days(std::move(days))
            {
            }

            /**
             * Parses `{"<site>": ["MM-DD", ...]}`. The document must hold exactly one site.
             * @throws ConfigError on any other shape
             */
            static BrumationCalendar parse(const std::string &jsonText);
            static BrumationCalendar fromFile(const std::filesystem::path &path);

            [[nodiscard]] bool isBrumationDay(const int month, const int day) const
            {
                return m_days.contains({month, day});
            }

            [[nodiscard]] const std::string &site() const
            {
                return m_site;
            }

            [[nodiscard]] size_t size() const
            {
                return m_days.size();
            }

        private:
            std::string                   m_site;
            std::set<std::pair<int, int>> m_days;
    };
} // namespace suf
