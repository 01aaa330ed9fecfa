#include "airline/seat_allocator.hpp"

#include <string>

namespace airline {

namespace {
const char* kComponent = "seat";

std::string seat_ref(FlightId flight_id, int seat) {
    return "seat " + std::to_string(seat) + " on flight " + std::to_string(flight_id);
}
} // namespace

SeatAllocator::SeatAllocator(InventoryStore& store, Logger& logger, RetryPolicy policy)
    : store_(store), logger_(logger), policy_(policy) {}

Result<bool> SeatAllocator::assign(CustomerId customer_id, FlightId flight_id, int new_seat,
                                   std::optional<int> old_seat) {
    if (old_seat && *old_seat == new_seat) {
        return bad_request("Cannot book the same seat you already have");
    }

    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    StoreSession& session = *lease.value();

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        TransactionGuard tx(session);
        Status st = tx.begin();
        if (!st) return st.error();

        // The ticket row read under the write lock is the only trusted source of the seat being left
        Result<std::optional<Ticket>> ticket = session.find_customer_ticket(customer_id, flight_id);
        if (!ticket) return ticket.error();
        if (!ticket.value()) {
            return bad_request("Customer does not have a ticket for this flight");
        }
        const std::optional<int> held_seat = ticket.value()->seat_number;
        if (held_seat && *held_seat == new_seat) {
            return bad_request("Cannot book the same seat you already have");
        }
        if (held_seat != old_seat) {
            logger_.debug(kComponent, "customer " + std::to_string(customer_id) + " moved seats meanwhile, leaving " +
                                      (held_seat ? seat_ref(flight_id, *held_seat) : std::string("no seat")));
        }

        Result<std::optional<Seat>> seat = session.find_seat(flight_id, new_seat);
        if (!seat) return seat.error();
        if (!seat.value()) {
            return validation_error("The new seat is not found");
        }
        if (seat.value()->status != SeatStatus::Available) {
            return conflict("The new seat is already booked or unavailable");
        }

        // Gate on the version we just read; zero rows means someone else got there first
        Result<int> booked = session.book_seat_if_version(flight_id, new_seat, seat.value()->version);
        if (!booked) return booked.error();
        if (booked.value() == 0) {
            st = tx.rollback();
            if (!st) return st.error();
            logger_.debug(kComponent, "version conflict on " + seat_ref(flight_id, new_seat) +
                                      ", attempt " + std::to_string(attempt));
            if (attempt < policy_.max_attempts) backoff(policy_);
            continue;
        }

        if (held_seat) {
            st = release_seat(session, flight_id, *held_seat);
            if (!st) return st.error();
        }

        Result<int> updated = session.set_ticket_seat(customer_id, flight_id, new_seat);
        if (!updated) return updated.error();
        if (updated.value() == 0) {
            st = tx.rollback();
            if (!st) return st.error();
            return bad_request("Customer does not have a ticket for this flight");
        }

        st = tx.commit();
        if (!st) return st.error();

        logger_.info(kComponent, "customer " + std::to_string(customer_id) + " now holds " +
                                 seat_ref(flight_id, new_seat));
        return true;
    }

    logger_.warn(kComponent, "gave up on " + seat_ref(flight_id, new_seat) + " after " +
                             std::to_string(policy_.max_attempts) + " attempts");
    return conflict("Failed to book the seat after maximum retries");
}

Result<bool> SeatAllocator::book_seat_for_ticket(CustomerId customer_id, FlightNumber flight_number,
                                                 const Date& flight_date, int seat) {
    std::optional<int> current_seat;
    FlightId flight_id = 0;
    {
        // Keep the lease short; assign() opens its own session
        Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
        if (!lease) return lease.error();
        StoreSession& session = *lease.value();

        Result<std::optional<Flight>> flight = session.find_flight(flight_number, flight_date);
        if (!flight) return flight.error();
        if (!flight.value()) {
            return not_found("Flight " + std::to_string(flight_number) + " does not exist on " +
                             flight_date.to_string());
        }
        flight_id = flight.value()->id;

        Result<std::optional<Ticket>> ticket = session.find_customer_ticket(customer_id, flight_id);
        if (!ticket) return ticket.error();
        if (!ticket.value()) {
            return bad_request("Customer does not have a ticket for this flight");
        }
        current_seat = ticket.value()->seat_number;
    }

    if (current_seat && *current_seat == seat) {
        return bad_request("Cannot book the same seat you already have");
    }
    return assign(customer_id, flight_id, seat, current_seat);
}

Status SeatAllocator::release_seat(FlightId flight_id, int seat) {
    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    return release_seat(*lease.value(), flight_id, seat);
}

Status SeatAllocator::release_seat(StoreSession& session, FlightId flight_id, int seat) {
    Result<int> rows = session.release_seat(flight_id, seat);
    if (!rows) return rows.error();
    if (rows.value() == 0) {
        logger_.warn(kComponent, "release of unknown " + seat_ref(flight_id, seat));
    } else {
        logger_.debug(kComponent, "released " + seat_ref(flight_id, seat));
    }
    return Status();
}

} // namespace airline
