#pragma once

#include "airline/error.hpp"
#include "airline/inventory_store.hpp"
#include "airline/types.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * @file flight_catalog.hpp
 * @brief Flight search and seat availability lookups.
 *
 * Both queries are plain reads. What they return is a hint for the caller;
 * only the allocators' version-gated writes decide who gets a ticket or seat.
 */

namespace airline {

class FlightCatalog {
public:
    explicit FlightCatalog(InventoryStore& store) : store_(store) {}

    /**
     * @brief Flights between two cities that still have tickets.
     *
     * @param departure_city Origin city, exact match.
     * @param destination_city Destination city, exact match.
     * @param departure_date First (or only) day to search.
     * @param end_date Last day to search, inclusive. Searches a single day when empty.
     * @return Matches ordered by date then flight number; BadRequest if end_date < departure_date.
     */
    Result<std::vector<FlightSummary>> search_flights(const std::string& departure_city,
                                                      const std::string& destination_city,
                                                      const Date& departure_date,
                                                      const std::optional<Date>& end_date = std::nullopt);

    /**
     * @brief AVAILABLE seat numbers of a flight, ascending. NotFound if the flight does not exist.
     */
    Result<std::vector<int>> available_seats(FlightNumber flight_number, const Date& flight_date);

private:
    InventoryStore& store_;
};

} // namespace airline
