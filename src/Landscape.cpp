#include "suf/Landscape.hpp"
#include "suf/Errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace suf
{
    namespace
    {
        std::string_view trim(std::string_view s)
        {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '"'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '"'))
                s.remove_suffix(1);
            return s;
        }

        std::vector<std::string_view> splitRow(const std::string_view line)
        {
            std::vector<std::string_view> out;
            size_t                        start = 0;
            for (;;)
            {
                const size_t comma = line.find(',', start);
                out.push_back(trim(line.substr(start, comma == std::string_view::npos ? comma : comma - start)));
                if (comma == std::string_view::npos)
                    break;
                start = comma + 1;
            }
            return out;
        }

        std::chrono::sys_seconds toTimePoint(const ThermalRecord &r)
        {
            using namespace std::chrono;
            const year_month_day ymd{year{r.year}, month{static_cast<unsigned>(r.month)},
                                     day{static_cast<unsigned>(r.day)}};
            return sys_days{ymd} + hours{r.hour} + minutes{r.minute} + seconds{r.second};
        }

        // Consumes the whole stream; trailing characters fail the parse.
        bool atEnd(std::istringstream &in)
        {
            if (in.fail())
                return false;
            if (in.eof())
                return true;
            in >> std::ws;
            return in.eof();
        }

        bool parseDatetime(const std::string_view s, ThermalRecord &r)
        {
            std::istringstream in{std::string(s)};
            char               dash1 = 0, dash2 = 0, colon1 = 0, colon2 = 0;
            in >> r.year >> dash1 >> r.month >> dash2 >> r.day >> r.hour >> colon1 >> r.minute >> colon2 >> r.second;
            if (in.fail() || dash1 != '-' || dash2 != '-' || colon1 != ':' || colon2 != ':' || !atEnd(in))
                return false;
            if (r.month < 1 || r.day < 1)
                return false;
            const std::chrono::year_month_day ymd{std::chrono::year{r.year},
                                                  std::chrono::month{static_cast<unsigned>(r.month)},
                                                  std::chrono::day{static_cast<unsigned>(r.day)}};
            return ymd.ok() && r.hour >= 0 && r.hour < 24 && r.minute >= 0 && r.minute < 60 && r.second >= 0 &&
                   r.second < 61;
        }

        bool parseMonthDay(const std::string &s, int &month, int &day)
        {
            std::istringstream in(s);
            char               dash = 0;
            in >> month >> dash >> day;
            return !in.fail() && dash == '-' && atEnd(in);
        }

        double parseNumber(const std::string_view s, const size_t lineNo, const std::string &column)
        {
            try
            {
                size_t            used = 0;
                const std::string buf(s);
                const double      v = std::stod(buf, &used);
                if (used != buf.size())
                    throw std::invalid_argument("trailing characters");
                return v;
            }
            catch (const std::exception &)
            {
                throw ConfigError("thermal profile line " + std::to_string(lineNo) + ": column '" + column +
                                  "' is not a number: '" + std::string(s) + "'");
            }
        }
    } // namespace

    Season seasonOf(const int month)
    {
        switch (month)
        {
            case 12:
            case 1:
            case 2:
                return Season::Winter;
            case 3:
            case 4:
            case 5:
                return Season::Spring;
            case 6:
            case 7:
            case 8:
                return Season::Summer;
            case 9:
            case 10:
            case 11:
                return Season::Fall;
            default:
                throw std::invalid_argument("month outside 1..12: " + std::to_string(month));
        }
    }

    std::string_view toString(const Season s)
    {
        switch (s)
        {
            case Season::Winter:
                return "Winter";
            case Season::Spring:
                return "Spring";
            case Season::Summer:
                return "Summer";
            case Season::Fall:
                return "Fall";
        }
        throw std::logic_error("unknown season");
    }

    Landscape Landscape::parseCsv(const std::string_view text, const std::string &openColumn,
                                  const std::string &burrowColumn)
    {
        std::vector<ThermalRecord> records;

        size_t pos    = 0;
        size_t lineNo = 0;
        long   iDate = -1, iOpen = -1, iBurrow = -1;
        size_t columns = 0;

        while (pos <= text.size())
        {
            const size_t     nl   = text.find('\n', pos);
            std::string_view line = text.substr(pos, nl == std::string_view::npos ? nl : nl - pos);
            pos                   = nl == std::string_view::npos ? text.size() + 1 : nl + 1;
            ++lineNo;

            if (trim(line).empty())
                continue;

            const auto cells = splitRow(line);
            if (iDate < 0)
            {
                columns = cells.size();
                for (size_t i = 0; i < cells.size(); ++i)
                {
                    if (cells[i] == "datetime")
                        iDate = static_cast<long>(i);
                    if (cells[i] == openColumn)
                        iOpen = static_cast<long>(i);
                    if (cells[i] == burrowColumn)
                        iBurrow = static_cast<long>(i);
                }
                if (iDate < 0)
                    throw ConfigError("thermal profile: missing 'datetime' column");
                if (iOpen < 0)
                    throw ConfigError("thermal profile: missing open temperature column '" + openColumn + "'");
                if (iBurrow < 0)
                    throw ConfigError("thermal profile: missing burrow temperature column '" + burrowColumn + "'");
                continue;
            }

            if (cells.size() != columns)
                throw ConfigError("thermal profile line " + std::to_string(lineNo) + ": expected " +
                                  std::to_string(columns) + " columns, got " + std::to_string(cells.size()));

            ThermalRecord r;
            if (!parseDatetime(cells[static_cast<size_t>(iDate)], r))
                throw ConfigError("thermal profile line " + std::to_string(lineNo) + ": bad datetime '" +
                                  std::string(cells[static_cast<size_t>(iDate)]) + "'");
            r.open   = parseNumber(cells[static_cast<size_t>(iOpen)], lineNo, openColumn);
            r.burrow = parseNumber(cells[static_cast<size_t>(iBurrow)], lineNo, burrowColumn);
            records.push_back(r);
        }

        if (iDate < 0)
            throw ConfigError("thermal profile: empty file");
        if (records.empty())
            throw ConfigError("thermal profile: no data rows");
        return Landscape(std::move(records));
    }

    Landscape Landscape::fromCsv(const std::filesystem::path &path, const std::string &openColumn,
                                 const std::string &burrowColumn)
    {
        std::ifstream f(path);
        if (!f)
            throw ConfigError("cannot open thermal profile: " + path.string());
        std::stringstream ss;
        ss << f.rdbuf();
        return parseCsv(ss.str(), openColumn, burrowColumn);
    }

    TickContext Landscape::contextAt(const size_t step) const
    {
        if (step >= m_records.size())
            throw std::out_of_range("tick " + std::to_string(step) + " is past the end of the thermal profile (" +
                                    std::to_string(m_records.size()) + " rows)");
        const ThermalRecord &r = m_records[step];

        TickContext ctx;
        ctx.step              = static_cast<int>(step);
        ctx.hour              = r.hour;
        ctx.day               = r.day;
        ctx.month             = r.month;
        ctx.year              = r.year;
        ctx.burrowTemperature = r.burrow;
        ctx.openTemperature   = r.open;
        return ctx;
    }

    size_t Landscape::stepsInOneYear() const
    {
        if (m_records.empty())
            return 0;
        const auto first = std::ranges::min(m_records, {}, [](const ThermalRecord &r)
        {
            return toTimePoint(r);
        });
        const auto start = toTimePoint(first);
        const auto end   = start + std::chrono::days{365};
        return static_cast<size_t>(std::ranges::count_if(m_records, [&](const ThermalRecord &r)
        {
            const auto t = toTimePoint(r);
            return t >= start && t < end;
        }));
    }

    BrumationCalendar BrumationCalendar::parse(const std::string &jsonText)
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(jsonText);
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(std::string("brumation calendar: ") + e.what());
        }
        if (!root.IsMap() || root.size() != 1)
            throw ConfigError("brumation calendar must contain exactly one site entry");

        const auto        it   = root.begin();
        const std::string site = it->first.as<std::string>();
        const YAML::Node  list = it->second;
        if (!list.IsSequence())
            throw ConfigError("brumation calendar: site '" + site + "' must map to a list of MM-DD dates");

        std::set<std::pair<int, int>> days;
        for (const auto &item : list)
        {
            const auto s     = item.as<std::string>();
            int        month = 0, day = 0;
            if (!parseMonthDay(s, month, day) || month < 1 || month > 12 || day < 1 || day > 31)
                throw ConfigError("brumation calendar: bad date '" + s + "'");
            days.emplace(month, day);
        }
        return {site, std::move(days)};
    }

    BrumationCalendar BrumationCalendar::fromFile(const std::filesystem::path &path)
    {
        std::ifstream f(path);
        if (!f)
            throw ConfigError("cannot open brumation calendar: " + path.string());
        std::stringstream ss;
        ss << f.rdbuf();
        return parse(ss.str());
    }
} // namespace suf
