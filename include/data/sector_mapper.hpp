/**
 * @file sector_mapper.hpp
 * @brief Ticker to sector mapping
 *
 * Provides the in-memory SectorLookup used by the sector balance rules,
 * the sector adjuster and the sector-biased candidate generator.
 */

#ifndef ALLOCATION_DATA_SECTOR_MAPPER_HPP
#define ALLOCATION_DATA_SECTOR_MAPPER_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "data/price_source.hpp"

namespace allocation {
namespace data {

/**
 * @class SectorMapping
 * @brief Maps tickers to sectors (and optional company names)
 *
 * Purpose:
 * - Load and store the mapping from tickers to sector names.
 * - Answer the SectorLookup queries: sector of a ticker, all tickers,
 *   tickers belonging to a sector.
 *
 * Thread safety:
 * - Instances are safe for concurrent read-only access after construction.
 *
 * Usage example:
 * @code
 * // CSV rows are: ticker,sector[,name]
 * auto mapping = SectorMapping::from_csv("data/sectors.csv");
 * auto pool = mapping.tickers_by_sector("Utilities");
 * @endcode
 */
class SectorMapping : public SectorLookup {
public:
    /**
     * @brief Default constructor
     * Creates an empty mapping.
     */
    SectorMapping() = default;

    /**
     * @brief Construct mapping from parallel vectors
     * @param tickers Vector of ticker symbols
     * @param sectors Vector of corresponding sector names (same length)
     * @param names Optional company names (empty or same length)
     * @throws std::invalid_argument if sizes differ or an entry is empty
     */
    SectorMapping(const std::vector<std::string>& tickers,
                  const std::vector<std::string>& sectors,
                  const std::vector<std::string>& names = {});

    /**
     * @brief Factory: create mapping from CSV file
     * @param filepath Path to CSV file with a header row, then: ticker,sector[,name]
     * @param delimiter Field delimiter (default: ',')
     * @return SectorMapping instance
     * @throws std::runtime_error on IO errors or when no valid row is found
     */
    static SectorMapping from_csv(const std::string& filepath, char delimiter = ',');

    /**
     * @brief Factory: create mapping from JSON
     * @param j JSON object with format: {"tickers": ["A","B"], "sectors": ["Tech","Fin"]}
     *          and an optional parallel "names" array
     * @return SectorMapping instance
     * @throws std::invalid_argument on missing fields or size mismatch
     */
    static SectorMapping from_json(const nlohmann::json& j);

    // SectorLookup
    std::string get_sector(const std::string& ticker) const override;
    std::vector<std::string> all_tickers() const override { return tickers_; }
    std::vector<std::string> tickers_by_sector(const std::string& sector) const override;

    /**
     * @brief Unique sectors in order of first appearance
     */
    std::vector<std::string> get_sectors() const;

    /**
     * @brief Company name for a ticker (the ticker itself when no name was given)
     */
    std::string get_name(const std::string& ticker) const;

    /**
     * @brief Serialize mapping to JSON (parallel arrays)
     */
    nlohmann::json to_json() const;

    size_t size() const { return tickers_.size(); }

    bool empty() const { return tickers_.empty(); }

private:
    std::vector<std::string> tickers_;                                        ///< Tickers in order
    std::unordered_map<std::string, std::string> ticker_to_sector_;           ///< ticker -> sector
    std::unordered_map<std::string, std::string> ticker_to_name_;             ///< ticker -> company name
    std::unordered_map<std::string, std::vector<std::string>> sector_to_tickers_; ///< sector -> tickers
    std::vector<std::string> sector_order_;                                   ///< First-seen sector order

    /**
     * @brief Rebuild reverse index (sector_to_tickers_) from tickers_
     */
    void build_reverse_index();
};

} // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_SECTOR_MAPPER_HPP
