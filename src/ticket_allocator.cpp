#include "airline/ticket_allocator.hpp"

#include <string>

namespace airline {

namespace {
const char* kComponent = "ticket";

std::string flight_ref(FlightNumber flight_number, const Date& date) {
    return "flight " + std::to_string(flight_number) + " on " + date.to_string();
}
} // namespace

TicketAllocator::TicketAllocator(InventoryStore& store, SeatAllocator& seats, Logger& logger,
                                 RetryPolicy policy)
    : store_(store), seats_(seats), logger_(logger), policy_(policy) {}

Result<TicketHandle> TicketAllocator::acquire(CustomerId customer_id, FlightNumber flight_number,
                                              const Date& flight_date) {
    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    StoreSession& session = *lease.value();

    Result<std::optional<Flight>> found = session.find_flight(flight_number, flight_date);
    if (!found) return found.error();
    if (!found.value()) {
        return not_found("Flight " + std::to_string(flight_number) + " does not exist on " +
                         flight_date.to_string());
    }
    const FlightId flight_id = found.value()->id;

    // Fast path only: the unique (customer, flight) constraint is what actually enforces this
    Result<std::optional<Ticket>> existing = session.find_customer_ticket(customer_id, flight_id);
    if (!existing) return existing.error();
    if (existing.value()) {
        return validation_error("Cannot re-book the same flight");
    }

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        Result<std::optional<Flight>> current = session.find_flight_by_id(flight_id);
        if (!current) return current.error();
        if (!current.value()) {
            return not_found("Flight " + std::to_string(flight_number) + " no longer exists on " +
                             flight_date.to_string());
        }
        const Flight& flight = *current.value();

        if (flight.available_tickets == 0) {
            return validation_error("This flight is fully booked.");
        }

        TransactionGuard tx(session);
        Status st = tx.begin();
        if (!st) return st.error();

        Result<int> rows = session.decrement_tickets_if_version(flight.id, flight.version);
        if (!rows) return rows.error();
        if (rows.value() == 0) {
            st = tx.rollback();
            if (!st) return st.error();
            logger_.debug(kComponent, "version " + std::to_string(flight.version) + " of " +
                                      flight_ref(flight_number, flight_date) + " is stale, attempt " +
                                      std::to_string(attempt));
            if (attempt < policy_.max_attempts) backoff(policy_);
            continue;
        }

        Ticket ticket;
        ticket.customer_id = customer_id;
        ticket.flight_id = flight.id;
        ticket.flight_date = flight.flight_date;
        ticket.flight_number = flight.flight_number;

        Result<std::optional<TicketId>> inserted = session.insert_ticket(ticket);
        if (!inserted) return inserted.error();
        if (!inserted.value()) {
            // A concurrent request from the same customer won; undo our decrement
            st = tx.rollback();
            if (!st) return st.error();
            return validation_error("Cannot re-book the same flight");
        }

        st = tx.commit();
        if (!st) return st.error();

        TicketHandle handle;
        handle.ticket_id = *inserted.value();
        handle.flight_id = flight.id;
        handle.flight_number = flight.flight_number;
        handle.flight_date = flight.flight_date;

        logger_.info(kComponent, "customer " + std::to_string(customer_id) + " booked ticket " +
                                 std::to_string(handle.ticket_id) + " on " +
                                 flight_ref(flight_number, flight_date));
        return handle;
    }

    logger_.warn(kComponent, "gave up on " + flight_ref(flight_number, flight_date) + " after " +
                             std::to_string(policy_.max_attempts) + " attempts");
    return validation_error("Failed to book " + flight_ref(flight_number, flight_date) +
                            " after maximum retries");
}

Status TicketAllocator::release(TicketId ticket_id) {
    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    StoreSession& session = *lease.value();

    TransactionGuard tx(session);
    Status st = tx.begin();
    if (!st) return st;

    Result<std::optional<Ticket>> found = session.find_ticket(ticket_id);
    if (!found) return found.error();
    if (!found.value()) {
        return not_found("Ticket " + std::to_string(ticket_id) + " not found");
    }
    const Ticket ticket = *found.value();

    // Delete first: only the caller that removed the row may return the quota
    Result<int> deleted = session.delete_ticket(ticket_id);
    if (!deleted) return deleted.error();
    if (deleted.value() == 0) {
        return not_found("Ticket " + std::to_string(ticket_id) + " not found");
    }

    if (ticket.seat_number) {
        st = seats_.release_seat(session, ticket.flight_id, *ticket.seat_number);
        if (!st) return st;
    }

    Result<int> restored = session.increment_tickets(ticket.flight_id);
    if (!restored) return restored.error();
    if (restored.value() == 0) {
        return not_found("Flight " + std::to_string(ticket.flight_id) + " of ticket " +
                         std::to_string(ticket_id) + " not found");
    }

    st = tx.commit();
    if (!st) return st;

    logger_.info(kComponent, "released ticket " + std::to_string(ticket_id) + " of customer " +
                             std::to_string(ticket.customer_id));
    return Status();
}

} // namespace airline
