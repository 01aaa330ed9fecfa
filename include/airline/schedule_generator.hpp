#pragma once

#include "airline/error.hpp"
#include "airline/inventory_store.hpp"
#include "airline/logger.hpp"
#include "airline/types.hpp"

/**
 * @file schedule_generator.hpp
 * @brief Publishes flight routes and instantiates their dated flights and seats.
 */

namespace airline {

/**
 * @brief Ticket quota of one dated flight: ceil(capacity * (1 + overbooking)).
 */
int ticket_quota(int capacity, double overbooking);

class ScheduleGenerator {
public:
    ScheduleGenerator(InventoryStore& store, Logger& logger) : store_(store), logger_(logger) {}

    /**
     * @brief Registers an aircraft type. BadRequest unless capacity > 0.
     */
    Status register_aircraft(const Aircraft& aircraft);

    /**
     * @brief Stores @p route and creates one flight per day of its validity window.
     *
     * @details
     * Each flight starts at version 1 with ticket_quota(capacity, overbooking)
     * tickets, and gets seats 1..capacity marked AVAILABLE. Everything is
     * written in one transaction.
     *
     * @return Number of flights created; NotFound for an unknown aircraft;
     *         BadRequest when the route has no end date, ends before it starts,
     *         or has a negative overbooking factor.
     */
    Result<int> publish_route(const FlightRoute& route);

private:
    InventoryStore& store_;
    Logger& logger_;
};

} // namespace airline
