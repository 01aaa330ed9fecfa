#pragma once

#include "airline/booking_orchestrator.hpp"
#include "airline/config.hpp"
#include "airline/error.hpp"
#include "airline/flight_catalog.hpp"
#include "airline/history_reader.hpp"
#include "airline/logger.hpp"
#include "airline/schedule_generator.hpp"
#include "airline/seat_allocator.hpp"
#include "airline/sqlite_store.hpp"
#include "airline/ticket_allocator.hpp"
#include "airline/types.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * @file booking_service.hpp
 * @brief Public API of the airline booking engine.
 *
 * This header defines BookingService, the single entry point a request layer
 * (HTTP handler, CLI, batch job) talks to. It wires one SQLite inventory store
 * to the allocators, the orchestrator and the read-side components.
 *
 * Concurrency model:
 * - Every call may run on its own thread; there is no engine-wide lock.
 * - Shared counters (ticket quota, seat status) are only changed by
 *   version-gated updates in the store.
 * - A multi-flight booking is all-or-nothing through compensation, not through
 *   a transaction spanning flights.
 */

namespace airline {

/**
 * @brief Airline booking engine facade.
 *
 * @details
 * Operations:
 * - publish schedules (aircraft, routes, dated flights, seats)
 * - search flights and list free seats
 * - book one or more flights, optionally with preferred seats
 * - change or pick a seat on an existing ticket
 * - release a ticket (cancellation or cleanup after a caller gave up)
 * - read a customer's booking history
 *
 * ### Thread-safety
 * All methods are safe to call concurrently once open() has succeeded.
 */
class BookingService {
public:
    /**
     * @brief Builds the engine. Nothing touches the database until open().
     */
    explicit BookingService(const EngineConfig& config);

    /**
     * @brief Creates the schema if needed. Must succeed before any other call.
     */
    Status open();

    /** @name Schedule */
    ///@{
    Status register_aircraft(const Aircraft& aircraft);
    Result<int> publish_route(const FlightRoute& route);
    ///@}

    /** @name Catalog */
    ///@{
    Result<std::vector<FlightSummary>> search_flights(const std::string& departure_city,
                                                      const std::string& destination_city,
                                                      const Date& departure_date,
                                                      const std::optional<Date>& end_date = std::nullopt);
    Result<std::vector<int>> available_seats(FlightNumber flight_number, const Date& flight_date);
    ///@}

    /** @name Booking */
    ///@{
    /**
     * @brief Books every requested flight for the customer, or none of them.
     * @see BookingOrchestrator::book_tickets
     */
    Result<BookingResult> book_tickets(CustomerId customer_id, const std::vector<LegRequest>& legs);

    /**
     * @brief Picks or changes the seat on a ticket the customer already holds.
     * @see SeatAllocator::book_seat_for_ticket
     */
    Result<bool> book_seat(CustomerId customer_id, FlightNumber flight_number, const Date& flight_date, int seat);

    /**
     * @brief Cancels a ticket, returning its quota and seat.
     * @see TicketAllocator::release
     */
    Status release_ticket(TicketId ticket_id);

    Result<std::vector<BookingHistoryRow>> history(CustomerId customer_id);
    ///@}

    Logger& logger() { return logger_; }

private:
    // Declaration order is construction order: components hold references to earlier members
    Logger logger_;
    SqliteInventoryStore store_;
    SeatAllocator seats_;
    TicketAllocator tickets_;
    BookingOrchestrator orchestrator_;
    HistoryReader history_;
    FlightCatalog catalog_;
    ScheduleGenerator schedule_;
};

} // namespace airline
