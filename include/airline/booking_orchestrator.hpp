#pragma once

#include "airline/error.hpp"
#include "airline/logger.hpp"
#include "airline/retry_policy.hpp"
#include "airline/seat_allocator.hpp"
#include "airline/ticket_allocator.hpp"
#include "airline/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @file booking_orchestrator.hpp
 * @brief Books several flights in one request with saga-style compensation.
 */

namespace airline {

/** @brief Status of a booking where every requested seat was granted. */
extern const char* const kBookingConfirmed;

/** @brief Status of a booking where at least one preferred seat could not be granted. */
extern const char* const kBookingSeatUnavailable;

/**
 * @brief One flight of a booking request.
 */
struct LegRequest {
    FlightNumber flight_number = 0;
    Date flight_date;
    std::optional<int> preferred_seat;
};

/**
 * @brief Outcome of one leg of a successful booking.
 */
struct LegResult {
    TicketId ticket_id = 0;
    FlightId flight_id = 0;
    std::string flight_details;        /**< "Flight <n> on <YYYY-MM-DD>". */
    std::optional<int> seat_number;    /**< Granted seat, if any. */
    bool seat_unavailable = false;     /**< A preferred seat was asked for and not granted. */
};

/**
 * @brief Outcome of a successful booking request.
 */
struct BookingResult {
    std::string booking_status;        /**< kBookingConfirmed or kBookingSeatUnavailable. */
    std::vector<LegResult> legs;       /**< In request order. */

    bool fully_confirmed() const { return booking_status == kBookingConfirmed; }
};

/**
 * @brief Composes TicketAllocator and SeatAllocator across the legs of a request.
 *
 * @details
 * Legs are booked one after another. A ticket is mandatory, a seat is best
 * effort: a leg whose preferred seat is taken still succeeds, flagged with
 * @ref LegResult::seat_unavailable.
 *
 * There is no transaction spanning flights. Every booked leg pushes an undo
 * action; when a later leg cannot get a ticket, the undo actions run in
 * reverse order and the caller receives one error:
 * - ValidationError, with the triggering error as its cause, when all undos ran
 * - CompensationFailed, with the triggering error as its cause and every
 *   failed undo in Error::compensation_failures, otherwise
 *
 * Undo actions go through TicketAllocator::release, so running one twice is
 * harmless: the second run finds no ticket and counts as done.
 */
class BookingOrchestrator {
public:
    BookingOrchestrator(TicketAllocator& tickets, SeatAllocator& seats, Logger& logger,
                        RetryPolicy compensation_policy = RetryPolicy{3, 1, 50});

    /**
     * @brief Books every leg for the customer, or none of them.
     *
     * @return The booking; BadRequest for an empty request; otherwise the
     *         aggregate error described above.
     */
    Result<BookingResult> book_tickets(CustomerId customer_id, const std::vector<LegRequest>& legs);

private:
    struct UndoAction {
        std::string description;
        std::function<Status()> run;
    };

    /** @brief Runs @p undo in reverse; returns the failures that survived all retries. */
    std::vector<Error> compensate(const std::vector<UndoAction>& undo);

    TicketAllocator& tickets_;
    SeatAllocator& seats_;
    Logger& logger_;
    RetryPolicy compensation_policy_;
};

} // namespace airline
