#pragma once

#include "airline/error.hpp"
#include "airline/inventory_store.hpp"
#include "airline/types.hpp"

#include <vector>

namespace airline {

/**
 * @brief Read-only view of a customer's bookings, newest flight date first.
 */
class HistoryReader {
public:
    explicit HistoryReader(InventoryStore& store) : store_(store) {}

    Result<std::vector<BookingHistoryRow>> history(CustomerId customer_id);

private:
    InventoryStore& store_;
};

} // namespace airline
