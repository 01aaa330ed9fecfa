#include "airline/booking_service.hpp"

namespace airline {

BookingService::BookingService(const EngineConfig& config)
    : logger_(config.log_file, config.log_level),
      store_(config.store),
      seats_(store_, logger_, config.seat_retry),
      tickets_(store_, seats_, logger_, config.ticket_retry),
      orchestrator_(tickets_, seats_, logger_, config.compensation_retry),
      history_(store_),
      catalog_(store_),
      schedule_(store_, logger_) {}

Status BookingService::open() {
    Status st = store_.init_schema();
    if (!st) {
        logger_.error("service", "cannot open " + store_.options().path + ": " + st.error().message);
        return st;
    }
    logger_.info("service", "inventory store ready at " + store_.options().path);
    return st;
}

Status BookingService::register_aircraft(const Aircraft& aircraft) {
    return schedule_.register_aircraft(aircraft);
}

Result<int> BookingService::publish_route(const FlightRoute& route) {
    return schedule_.publish_route(route);
}

Result<std::vector<FlightSummary>> BookingService::search_flights(const std::string& departure_city,
                                                                  const std::string& destination_city,
                                                                  const Date& departure_date,
                                                                  const std::optional<Date>& end_date) {
    return catalog_.search_flights(departure_city, destination_city, departure_date, end_date);
}

Result<std::vector<int>> BookingService::available_seats(FlightNumber flight_number, const Date& flight_date) {
    return catalog_.available_seats(flight_number, flight_date);
}

Result<BookingResult> BookingService::book_tickets(CustomerId customer_id, const std::vector<LegRequest>& legs) {
    return orchestrator_.book_tickets(customer_id, legs);
}

Result<bool> BookingService::book_seat(CustomerId customer_id, FlightNumber flight_number,
                                       const Date& flight_date, int seat) {
    return seats_.book_seat_for_ticket(customer_id, flight_number, flight_date, seat);
}

Status BookingService::release_ticket(TicketId ticket_id) {
    return tickets_.release(ticket_id);
}

Result<std::vector<BookingHistoryRow>> BookingService::history(CustomerId customer_id) {
    return history_.history(customer_id);
}

} // namespace airline
