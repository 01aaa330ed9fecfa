#pragma once

#include "airline/error.hpp"
#include "airline/inventory_store.hpp"
#include "airline/logger.hpp"
#include "airline/retry_policy.hpp"
#include "airline/types.hpp"

#include <optional>

/**
 * @file seat_allocator.hpp
 * @brief Claims, moves and frees seats on a single flight via optimistic concurrency.
 */

namespace airline {

/**
 * @brief Seat assignment protocol.
 *
 * @details
 * Every attempt runs inside one store transaction:
 * - read the customer's ticket; its seat_number is the seat being left
 * - read the target seat (status, version)
 * - reject with Conflict if it is not AVAILABLE (a business rejection, not retried)
 * - BOOK it with an update gated on (version, status = AVAILABLE)
 * - zero rows changed means a concurrent writer won: roll back, back off, retry
 * - free the seat the ticket held, point the ticket at the new seat, commit
 *
 * The retry budget is bounded. Spending it surfaces Conflict
 * ("failed after maximum retries") to the caller.
 *
 * ### Thread-safety
 * All methods may be called concurrently. Each call leases its own store session.
 */
class SeatAllocator {
public:
    static constexpr int kDefaultMaxAttempts = 3;

    SeatAllocator(InventoryStore& store, Logger& logger,
                  RetryPolicy policy = RetryPolicy{kDefaultMaxAttempts, 1, 50});

    /**
     * @brief Moves a customer's seat on @p flight_id to @p new_seat, freeing the seat held before.
     *
     * @param customer_id Customer that owns the ticket on the flight.
     * @param flight_id Dated flight.
     * @param new_seat Seat to claim.
     * @param old_seat Seat the caller believes is held. Only used to reject a
     *        same-seat request early; the ticket row read inside the
     *        transaction decides which seat is freed.
     * @return true on success; otherwise:
     *   - BadRequest if the customer holds no ticket or already sits in new_seat
     *   - ValidationError if the seat does not exist
     *   - Conflict if the seat is taken or the retry budget ran out
     */
    Result<bool> assign(CustomerId customer_id, FlightId flight_id, int new_seat,
                        std::optional<int> old_seat);

    /**
     * @brief Books @p seat for the ticket the customer already holds on (flight_number, date).
     *
     * @return true on success; NotFound when the flight does not exist; BadRequest when
     *         the customer has no ticket or already sits in @p seat; otherwise as assign().
     */
    Result<bool> book_seat_for_ticket(CustomerId customer_id, FlightNumber flight_number,
                                      const Date& flight_date, int seat);

    /**
     * @brief Marks a seat AVAILABLE again (unconditional, bumps the version).
     */
    Status release_seat(FlightId flight_id, int seat);

    /**
     * @brief Same as release_seat(), inside the caller's session and transaction.
     */
    Status release_seat(StoreSession& session, FlightId flight_id, int seat);

    const RetryPolicy& policy() const { return policy_; }

private:
    InventoryStore& store_;
    Logger& logger_;
    RetryPolicy policy_;
};

} // namespace airline
