#include "airline/booking_orchestrator.hpp"

namespace airline {

const char* const kBookingConfirmed = "Confirmed";
const char* const kBookingSeatUnavailable =
    "Confirmed booking, however the preferred seat is currently unavailable, please try again later.";

namespace {
const char* kComponent = "booking";
} // namespace

BookingOrchestrator::BookingOrchestrator(TicketAllocator& tickets, SeatAllocator& seats, Logger& logger,
                                         RetryPolicy compensation_policy)
    : tickets_(tickets), seats_(seats), logger_(logger), compensation_policy_(compensation_policy) {}

Result<BookingResult> BookingOrchestrator::book_tickets(CustomerId customer_id,
                                                        const std::vector<LegRequest>& legs) {
    if (legs.empty()) {
        return bad_request("No flights provided");
    }

    BookingResult result;
    result.booking_status = kBookingConfirmed;
    std::vector<UndoAction> undo;

    for (const auto& leg : legs) {
        Result<TicketHandle> ticket = tickets_.acquire(customer_id, leg.flight_number, leg.flight_date);
        if (!ticket) {
            logger_.warn(kComponent, "customer " + std::to_string(customer_id) + " could not book flight " +
                                     std::to_string(leg.flight_number) + " on " + leg.flight_date.to_string() +
                                     ": " + ticket.error().message + "; rolling back " +
                                     std::to_string(undo.size()) + " leg(s)");

            std::vector<Error> failures = compensate(undo);
            if (failures.empty()) {
                return validation_error("Failed to book some of your flights, please try again")
                    .caused_by(ticket.error());
            }

            Error err(ErrorKind::CompensationFailed,
                      "Failed to book some of your flights and could not undo " +
                      std::to_string(failures.size()) + " of them");
            err = err.caused_by(ticket.error());
            err.compensation_failures = std::move(failures);
            logger_.error(kComponent, err.to_string());
            return err;
        }

        const TicketHandle& handle = ticket.value();
        const TicketId ticket_id = handle.ticket_id;
        undo.push_back(UndoAction{
            "release ticket " + std::to_string(ticket_id),
            [this, ticket_id]() { return tickets_.release(ticket_id); }});

        LegResult leg_result;
        leg_result.ticket_id = handle.ticket_id;
        leg_result.flight_id = handle.flight_id;
        leg_result.flight_details = "Flight " + std::to_string(handle.flight_number) + " on " +
                                    handle.flight_date.to_string();

        // The ticket stands whatever happens to the seat
        if (leg.preferred_seat) {
            Result<bool> seat = seats_.assign(customer_id, handle.flight_id, *leg.preferred_seat, std::nullopt);
            if (seat) {
                leg_result.seat_number = *leg.preferred_seat;
            } else {
                leg_result.seat_unavailable = true;
                result.booking_status = kBookingSeatUnavailable;
                logger_.warn(kComponent, "preferred seat " + std::to_string(*leg.preferred_seat) +
                                         " not granted for ticket " + std::to_string(ticket_id) + ": " +
                                         seat.error().message);
            }
        }

        result.legs.push_back(std::move(leg_result));
    }

    logger_.info(kComponent, "customer " + std::to_string(customer_id) + " booked " +
                             std::to_string(result.legs.size()) + " flight(s): " + result.booking_status);
    return result;
}

std::vector<Error> BookingOrchestrator::compensate(const std::vector<UndoAction>& undo) {
    std::vector<Error> failures;

    for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
        std::optional<Error> last;
        for (int attempt = 1; attempt <= compensation_policy_.max_attempts; ++attempt) {
            Status st = it->run();
            // NotFound means an earlier run already removed the ticket
            if (st.ok() || st.error().kind == ErrorKind::NotFound) {
                last.reset();
                break;
            }
            last = st.error();
            logger_.error(kComponent, it->description + " failed, attempt " + std::to_string(attempt) +
                                      ": " + st.error().message);
            if (attempt < compensation_policy_.max_attempts) backoff(compensation_policy_);
        }

        if (last) {
            Error failure(last->kind, it->description + " failed: " + last->message);
            failures.push_back(std::move(failure));
        } else {
            logger_.info(kComponent, it->description + " done");
        }
    }
    return failures;
}

} // namespace airline
