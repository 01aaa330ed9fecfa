#pragma once

#include "airline/error.hpp"
#include "airline/types.hpp"

#include <memory>
#include <optional>
#include <vector>

/**
 * @file inventory_store.hpp
 * @brief Data-access seam between the booking engine and the relational store.
 *
 * The engine talks to the store only through StoreSession. A session wraps
 * one leased connection: it is used by one thread at a time and hands the
 * connection back when destroyed.
 *
 * Conditional updates report how many rows they changed. Zero rows on a
 * version-gated update means another writer won the race.
 */

namespace airline {

/**
 * @brief One connection's worth of store operations.
 */
class StoreSession {
public:
    virtual ~StoreSession() = default;

    // Transactions. begin() takes the write lock up front.
    virtual Status begin() = 0;
    virtual Status commit() = 0;
    virtual Status rollback() = 0;

    // Flights
    virtual Result<std::optional<Flight>> find_flight(FlightNumber flight_number, const Date& date) = 0;
    virtual Result<std::optional<Flight>> find_flight_by_id(FlightId flight_id) = 0;

    /**
     * @brief available_tickets -= 1, version += 1 when the version still matches.
     * @return Rows affected (0 or 1).
     */
    virtual Result<int> decrement_tickets_if_version(FlightId flight_id, int expected_version) = 0;

    /**
     * @brief available_tickets += 1, version += 1 without a version check.
     * @return Rows affected.
     */
    virtual Result<int> increment_tickets(FlightId flight_id) = 0;

    // Tickets
    /**
     * @brief Inserts a ticket row.
     * @return New ticket id, or std::nullopt when (customer, flight) already has a ticket.
     */
    virtual Result<std::optional<TicketId>> insert_ticket(const Ticket& ticket) = 0;
    virtual Result<std::optional<Ticket>> find_ticket(TicketId ticket_id) = 0;
    virtual Result<std::optional<Ticket>> find_customer_ticket(CustomerId customer_id, FlightId flight_id) = 0;
    virtual Result<int> delete_ticket(TicketId ticket_id) = 0;
    virtual Result<int> set_ticket_seat(CustomerId customer_id, FlightId flight_id, int seat_number) = 0;

    // Seats
    virtual Result<std::optional<Seat>> find_seat(FlightId flight_id, int seat_number) = 0;

    /**
     * @brief status = BOOKED, version += 1 when the seat is AVAILABLE at @p expected_version.
     * @return Rows affected (0 or 1).
     */
    virtual Result<int> book_seat_if_version(FlightId flight_id, int seat_number, int expected_version) = 0;

    /**
     * @brief status = AVAILABLE, version += 1 without a version check.
     */
    virtual Result<int> release_seat(FlightId flight_id, int seat_number) = 0;
    virtual Result<std::vector<int>> list_available_seats(FlightId flight_id) = 0;

    // Read models
    virtual Result<std::vector<BookingHistoryRow>> customer_history(CustomerId customer_id) = 0;
    virtual Result<std::vector<FlightSummary>> search_flights(const std::string& departure_city,
                                                              const std::string& destination_city,
                                                              const Date& from,
                                                              const Date& to) = 0;

    // Schedule
    virtual Status insert_aircraft(const Aircraft& aircraft) = 0;
    virtual Result<std::optional<Aircraft>> find_aircraft(AircraftId aircraft_id) = 0;
    virtual Status insert_route(const FlightRoute& route) = 0;
    virtual Result<FlightId> insert_flight(FlightNumber flight_number, const Date& date, int available_tickets) = 0;
    virtual Status insert_seats(FlightId flight_id, int seat_count) = 0;
};

/**
 * @brief Factory of sessions over a shared store.
 *
 * Implementations must be safe to call from many threads at once.
 */
class InventoryStore {
public:
    virtual ~InventoryStore() = default;

    /**
     * @brief Leases a connection.
     * @return A session, or DatabaseError when no connection frees up in time.
     */
    virtual Result<std::unique_ptr<StoreSession>> open_session() = 0;
};

/**
 * @brief RAII guard that rolls back an open transaction unless it was committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(StoreSession& session) : session_(session) {}
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    Status begin();
    Status commit();
    Status rollback();

private:
    StoreSession& session_;
    bool active_ = false;
};

} // namespace airline
