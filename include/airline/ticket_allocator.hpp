#pragma once

#include "airline/error.hpp"
#include "airline/inventory_store.hpp"
#include "airline/logger.hpp"
#include "airline/retry_policy.hpp"
#include "airline/seat_allocator.hpp"
#include "airline/types.hpp"

/**
 * @file ticket_allocator.hpp
 * @brief Claims and returns units of a dated flight's ticket quota.
 */

namespace airline {

/**
 * @brief A claimed unit of quota.
 */
struct TicketHandle {
    TicketId ticket_id = 0;
    FlightId flight_id = 0;
    FlightNumber flight_number = 0;
    Date flight_date;
};

/**
 * @brief Ticket quota protocol.
 *
 * @details
 * acquire() re-reads the flight on every attempt and decrements
 * available_tickets with an update gated on the version it read. A miss
 * means a concurrent acquire or release committed first; the loop backs off
 * for a random delay and tries again, up to the policy's attempt budget.
 *
 * Because a caller can only lose the race when someone else's write went
 * through, the number of misses per call is bounded by the number of quota
 * changes that happen meanwhile; the budget only caps pathological churn.
 *
 * The decrement and the ticket insert commit together. A duplicate
 * (customer, flight) pair trips the store's unique constraint, which rolls
 * the decrement back.
 */
class TicketAllocator {
public:
    static constexpr int kDefaultMaxAttempts = 10;

    TicketAllocator(InventoryStore& store, SeatAllocator& seats, Logger& logger,
                    RetryPolicy policy = RetryPolicy{kDefaultMaxAttempts, 1, 50});

    /**
     * @brief Claims one ticket on (flight_number, flight_date) for a customer.
     *
     * @return The new ticket; otherwise:
     *   - NotFound if the flight does not exist
     *   - ValidationError if the flight is fully booked, the customer already
     *     holds a ticket on it, or the retry budget ran out
     *   - DatabaseError on store failure
     */
    Result<TicketHandle> acquire(CustomerId customer_id, FlightNumber flight_number,
                                 const Date& flight_date);

    /**
     * @brief Returns a ticket's quota unit, frees its seat and deletes it.
     *
     * @details
     * Runs in one transaction. The ticket row is deleted first and the quota is
     * only returned when that delete removed a row, so releasing the same ticket
     * twice yields NotFound and never returns quota twice.
     */
    Status release(TicketId ticket_id);

    const RetryPolicy& policy() const { return policy_; }

private:
    InventoryStore& store_;
    SeatAllocator& seats_;
    Logger& logger_;
    RetryPolicy policy_;
};

} // namespace airline
