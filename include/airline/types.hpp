#pragma once

#include <optional>
#include <string>

/**
 * @file types.hpp
 * @brief Domain types shared by the booking engine and the inventory store.
 *
 * This header defines:
 * - Calendar helpers: Date, TimeOfDay
 * - Inventory rows: Aircraft, FlightRoute, Flight, Seat, Ticket
 * - Read models: FlightSummary, BookingHistoryRow
 *
 * Rows are plain values. The inventory store is the only source of truth,
 * so a row read here is a snapshot and never authoritative for a write.
 */

namespace airline {

/**
 * @brief Flight identifier (row id of a dated flight).
 */
using FlightId = int;

/**
 * @brief Public flight number of a route, e.g. 101.
 */
using FlightNumber = int;

/**
 * @brief Customer identifier, owned by the account system.
 */
using CustomerId = int;

/**
 * @brief Ticket identifier.
 */
using TicketId = int;

/**
 * @brief Aircraft identifier.
 */
using AircraftId = int;

/**
 * @brief A calendar date without time zone.
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /**
     * @brief Parses "YYYY-MM-DD".
     *
     * @param text Input text.
     * @param out Parsed date on success.
     * @return True if @p text is a valid calendar date (leap years included).
     */
    static bool try_parse(const std::string& text, Date& out);

    /** @brief Formats as "YYYY-MM-DD". */
    std::string to_string() const;

    /** @brief The following calendar day. */
    Date next_day() const;

    friend bool operator==(const Date& a, const Date& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const Date& a, const Date& b) { return !(a == b); }
    friend bool operator<(const Date& a, const Date& b) {
        if (a.year != b.year) return a.year < b.year;
        if (a.month != b.month) return a.month < b.month;
        return a.day < b.day;
    }
    friend bool operator<=(const Date& a, const Date& b) { return !(b < a); }
};

/**
 * @brief Number of days in a month, or 0 for an invalid month.
 */
int days_in_month(int year, int month);

/**
 * @brief A time of day with second precision.
 */
struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;

    /**
     * @brief Parses "HH:MM" or "HH:MM:SS" (24h clock).
     */
    static bool try_parse(const std::string& text, TimeOfDay& out);

    /** @brief Formats as "HH:MM:SS". */
    std::string to_string() const;

    friend bool operator==(const TimeOfDay& a, const TimeOfDay& b) {
        return a.hour == b.hour && a.minute == b.minute && a.second == b.second;
    }
};

/**
 * @brief Booking state of a single seat.
 */
enum class SeatStatus {
    Available,
    Booked,
    Unavailable
};

/** @brief Stored name of a seat status ("AVAILABLE", "BOOKED", "UNAVAILABLE"). */
const char* to_string(SeatStatus status);

/** @brief Parses a stored seat status name. */
bool try_parse_seat_status(const std::string& text, SeatStatus& out);

/**
 * @brief An aircraft type with its physical seat count.
 */
struct Aircraft {
    AircraftId id = 0;
    int capacity = 0;
};

/**
 * @brief Static route template that dated flights are instantiated from.
 */
struct FlightRoute {
    FlightNumber flight_number = 0;
    std::string departure_city;
    std::string destination_city;
    TimeOfDay departure_time;
    TimeOfDay arrival_time;
    AircraftId aircraft_id = 0;
    double overbooking = 0.0;        /**< 0.10 sells 10% more tickets than seats. */
    Date start_date;
    std::optional<Date> end_date;    /**< Open-ended when empty. */
};

/**
 * @brief A dated flight and its remaining ticket quota.
 */
struct Flight {
    FlightId id = 0;
    FlightNumber flight_number = 0;
    Date flight_date;
    int available_tickets = 0;       /**< Never negative. */
    int version = 0;                 /**< Incremented on every quota mutation. */
};

/**
 * @brief One seat of one dated flight.
 */
struct Seat {
    FlightId flight_id = 0;
    int seat_number = 0;
    SeatStatus status = SeatStatus::Available;
    int version = 0;
};

/**
 * @brief A booking record. At most one per (customer, flight).
 */
struct Ticket {
    TicketId id = 0;
    CustomerId customer_id = 0;
    FlightId flight_id = 0;
    std::optional<int> seat_number;
    Date flight_date;                /**< Denormalized from the flight. */
    FlightNumber flight_number = 0;  /**< Denormalized from the flight. */
};

/**
 * @brief A flight search hit.
 */
struct FlightSummary {
    FlightId flight_id = 0;
    FlightNumber flight_number = 0;
    std::string departure_city;
    std::string destination_city;
    TimeOfDay departure_time;
    TimeOfDay arrival_time;
    int available_tickets = 0;
    Date flight_date;
};

/**
 * @brief One line of a customer's booking history.
 */
struct BookingHistoryRow {
    FlightNumber flight_number = 0;
    std::string seat_number;         /**< Seat number, or "Not Selected". */
    std::string departure_city;
    std::string destination_city;
    Date flight_date;
    TimeOfDay departure_time;
    TimeOfDay arrival_time;
};

} // namespace airline
