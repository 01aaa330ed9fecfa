#include "airline/schedule_generator.hpp"

#include <cmath>
#include <string>

namespace airline {

namespace {
const char* kComponent = "schedule";
} // namespace

int ticket_quota(int capacity, double overbooking) {
    // Round away tiny float error first so 100 * 1.10 gives 110, not 111
    const double exact = capacity * (1.0 + overbooking);
    return static_cast<int>(std::ceil(exact - 1e-9));
}

Status ScheduleGenerator::register_aircraft(const Aircraft& aircraft) {
    if (aircraft.capacity <= 0) {
        return bad_request("Aircraft capacity must be positive");
    }

    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();

    Status st = lease.value()->insert_aircraft(aircraft);
    if (st) {
        logger_.info(kComponent, "registered aircraft " + std::to_string(aircraft.id) + " with " +
                                 std::to_string(aircraft.capacity) + " seats");
    }
    return st;
}

Result<int> ScheduleGenerator::publish_route(const FlightRoute& route) {
    if (!route.end_date) {
        return bad_request("Route " + std::to_string(route.flight_number) + " needs an end date to be scheduled");
    }
    if (*route.end_date < route.start_date) {
        return bad_request("Route " + std::to_string(route.flight_number) + " ends before it starts");
    }
    if (route.overbooking < 0.0) {
        return bad_request("Overbooking factor cannot be negative");
    }

    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    StoreSession& session = *lease.value();

    Result<std::optional<Aircraft>> aircraft = session.find_aircraft(route.aircraft_id);
    if (!aircraft) return aircraft.error();
    if (!aircraft.value()) {
        return not_found("Aircraft " + std::to_string(route.aircraft_id) + " not found");
    }
    const int capacity = aircraft.value()->capacity;
    const int quota = ticket_quota(capacity, route.overbooking);

    TransactionGuard tx(session);
    Status st = tx.begin();
    if (!st) return st.error();

    st = session.insert_route(route);
    if (!st) return st.error();

    int created = 0;
    for (Date day = route.start_date; day <= *route.end_date; day = day.next_day()) {
        Result<FlightId> flight_id = session.insert_flight(route.flight_number, day, quota);
        if (!flight_id) return flight_id.error();

        st = session.insert_seats(flight_id.value(), capacity);
        if (!st) return st.error();
        ++created;
    }

    st = tx.commit();
    if (!st) return st.error();

    logger_.info(kComponent, "published route " + std::to_string(route.flight_number) + " " +
                             route.departure_city + " -> " + route.destination_city + ": " +
                             std::to_string(created) + " flight(s), " + std::to_string(quota) +
                             " tickets each");
    return created;
}

} // namespace airline
