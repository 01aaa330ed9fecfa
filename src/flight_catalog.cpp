#include "airline/flight_catalog.hpp"

namespace airline {

Result<std::vector<FlightSummary>> FlightCatalog::search_flights(const std::string& departure_city,
                                                                 const std::string& destination_city,
                                                                 const Date& departure_date,
                                                                 const std::optional<Date>& end_date) {
    const Date last = end_date ? *end_date : departure_date;
    if (last < departure_date) {
        return bad_request("End date " + last.to_string() + " is before departure date " +
                           departure_date.to_string());
    }

    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    return lease.value()->search_flights(departure_city, destination_city, departure_date, last);
}

Result<std::vector<int>> FlightCatalog::available_seats(FlightNumber flight_number, const Date& flight_date) {
    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    StoreSession& session = *lease.value();

    Result<std::optional<Flight>> flight = session.find_flight(flight_number, flight_date);
    if (!flight) return flight.error();
    if (!flight.value()) {
        return not_found("Flight not found");
    }
    return session.list_available_seats(flight.value()->id);
}

} // namespace airline
