/**
 * @file sector_mapper.cpp
 * @brief Implementation of SectorMapping for ticker->sector mappings
 */

#include "data/sector_mapper.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace allocation {
namespace data {

// Trim helpers (left/right)
static inline std::string ltrim(std::string s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

static inline std::string rtrim(std::string s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

static inline std::string trim(std::string s)
{
    return ltrim(rtrim(std::move(s)));
}

// Strip one level of surrounding double quotes ("Health Care")
static inline std::string unquote(std::string s)
{
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
    {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

SectorMapping::SectorMapping(const std::vector<std::string>& tickers,
                             const std::vector<std::string>& sectors,
                             const std::vector<std::string>& names)
{
    if (tickers.size() != sectors.size())
    {
        throw std::invalid_argument("SectorMapping: tickers and sectors size mismatch");
    }
    if (!names.empty() && names.size() != tickers.size())
    {
        throw std::invalid_argument("SectorMapping: tickers and names size mismatch");
    }

    for (size_t i = 0; i < tickers.size(); ++i)
    {
        const std::string t = trim(tickers[i]);
        const std::string s = trim(sectors[i]);
        if (t.empty())
        {
            throw std::invalid_argument("SectorMapping: empty ticker at index " + std::to_string(i));
        }
        if (s.empty())
        {
            throw std::invalid_argument("SectorMapping: empty sector for ticker '" + t + "'");
        }
        if (ticker_to_sector_.count(t) == 0)
        {
            tickers_.push_back(t);
        }
        ticker_to_sector_[t] = s;
        if (!names.empty() && !trim(names[i]).empty())
        {
            ticker_to_name_[t] = trim(names[i]);
        }
    }

    build_reverse_index();
}

SectorMapping SectorMapping::from_csv(const std::string& filepath, char delimiter)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("SectorMapping::from_csv: could not open file: " + filepath);
    }

    std::string line;
    std::vector<std::string> tickers;
    std::vector<std::string> sectors;
    std::vector<std::string> names;

    // First line is the header
    if (!std::getline(file, line))
    {
        throw std::runtime_error("SectorMapping::from_csv: empty file: " + filepath);
    }

    while (std::getline(file, line))
    {
        if (line.empty())
            continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string item;
        while (std::getline(ss, item, delimiter))
        {
            fields.push_back(unquote(trim(item)));
        }

        if (fields.size() < 2 || fields[0].empty() || fields[1].empty())
        {
            continue; // skip malformed rows
        }

        tickers.push_back(fields[0]);
        sectors.push_back(fields[1]);
        names.push_back(fields.size() > 2 ? fields[2] : std::string());
    }

    if (tickers.empty())
    {
        throw std::runtime_error("SectorMapping::from_csv: no valid mappings found in: " + filepath);
    }

    return SectorMapping(tickers, sectors, names);
}

SectorMapping SectorMapping::from_json(const nlohmann::json& j)
{
    if (!j.contains("tickers") || !j.contains("sectors"))
    {
        throw std::invalid_argument("SectorMapping::from_json: JSON must contain 'tickers' and 'sectors' arrays");
    }

    std::vector<std::string> tickers = j.at("tickers").get<std::vector<std::string>>();
    std::vector<std::string> sectors = j.at("sectors").get<std::vector<std::string>>();
    std::vector<std::string> names = j.value("names", std::vector<std::string>{});

    return SectorMapping(tickers, sectors, names);
}

void SectorMapping::build_reverse_index()
{
    sector_to_tickers_.clear();
    sector_order_.clear();
    for (const auto& ticker : tickers_)
    {
        const std::string& sector = ticker_to_sector_.at(ticker);
        auto& members = sector_to_tickers_[sector];
        if (members.empty())
        {
            sector_order_.push_back(sector);
        }
        members.push_back(ticker);
    }
}

std::string SectorMapping::get_sector(const std::string& ticker) const
{
    auto it = ticker_to_sector_.find(ticker);
    if (it == ticker_to_sector_.end())
    {
        return UNKNOWN_SECTOR;
    }
    return it->second;
}

std::vector<std::string> SectorMapping::tickers_by_sector(const std::string& sector) const
{
    auto it = sector_to_tickers_.find(sector);
    if (it == sector_to_tickers_.end())
    {
        return {};
    }
    return it->second;
}

std::vector<std::string> SectorMapping::get_sectors() const
{
    return sector_order_;
}

std::string SectorMapping::get_name(const std::string& ticker) const
{
    auto it = ticker_to_name_.find(ticker);
    return it != ticker_to_name_.end() ? it->second : ticker;
}

nlohmann::json SectorMapping::to_json() const
{
    nlohmann::json j;
    j["tickers"] = tickers_;
    std::vector<std::string> sectors;
    std::vector<std::string> names;
    sectors.reserve(tickers_.size());
    names.reserve(tickers_.size());
    for (const auto& ticker : tickers_)
    {
        sectors.push_back(ticker_to_sector_.at(ticker));
        names.push_back(get_name(ticker));
    }
    j["sectors"] = sectors;
    j["names"] = names;
    return j;
}

} // namespace data
} // namespace allocation
