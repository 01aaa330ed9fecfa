#include "airline/booking_service.hpp"
#include "airline/config.hpp"

#include <iostream>
#include <sstream>

static void print_help() {
    std::cout
        << "Commands:\n"
        << "  aircraft <aircraft_id> <capacity>\n"
        << "  route <flight_no> <from> <to> <dep HH:MM> <arr HH:MM> <aircraft_id> <overbooking> <start> <end>\n"
        << "  search <from> <to> <date> [end_date]\n"
        << "  seats <flight_no> <date>\n"
        << "  book <customer_id> <flight_no> <date>[:seat] [<flight_no> <date>[:seat] ...]\n"
        << "  seat <customer_id> <flight_no> <date> <seat>\n"
        << "  release <ticket_id>\n"
        << "  history <customer_id>\n"
        << "  exit\n"
        << "Dates are YYYY-MM-DD.\n";
}

static void print_error(const airline::Error& err) {
    std::cout << "FAIL (" << airline::http_status(err.kind) << "): " << err.to_string() << "\n";
}

// Parses "YYYY-MM-DD" or "YYYY-MM-DD:seat"
static bool parse_leg_date(const std::string& token, airline::Date& date, std::optional<int>& seat) {
    const std::size_t colon = token.find(':');
    if (!airline::Date::try_parse(token.substr(0, colon), date)) return false;
    seat.reset();
    if (colon == std::string::npos) return true;

    std::istringstream iss(token.substr(colon + 1));
    int s = 0;
    if (!(iss >> s) || !iss.eof() || s < 1) return false;
    seat = s;
    return true;
}

int main(int argc, char* argv[]) {
    airline::Result<airline::EngineConfig> config = airline::parse_config(argc, argv);
    if (!config) {
        std::cerr << config.error().to_string() << "\n";
        return 2;
    }
    if (config.value().show_help) {
        std::cout << config.value().usage;
        return 0;
    }

    airline::BookingService svc(config.value());
    airline::Status opened = svc.open();
    if (!opened) {
        std::cerr << opened.error().to_string() << "\n";
        return 1;
    }

    std::cout << "Airline Booking CLI\n";
    print_help();

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) break;
        if (line == "exit") break;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help") {
            print_help();
        } else if (cmd == "aircraft") {
            airline::Aircraft a;
            if (!(iss >> a.id >> a.capacity)) {
                std::cout << "Usage: aircraft <aircraft_id> <capacity>\n";
                continue;
            }
            airline::Status st = svc.register_aircraft(a);
            if (st) std::cout << "OK\n"; else print_error(st.error());
        } else if (cmd == "route") {
            airline::FlightRoute r;
            std::string dep, arr, start, end;
            airline::Date end_date;
            if (!(iss >> r.flight_number >> r.departure_city >> r.destination_city >> dep >> arr
                      >> r.aircraft_id >> r.overbooking >> start >> end) ||
                !airline::TimeOfDay::try_parse(dep, r.departure_time) ||
                !airline::TimeOfDay::try_parse(arr, r.arrival_time) ||
                !airline::Date::try_parse(start, r.start_date) ||
                !airline::Date::try_parse(end, end_date)) {
                std::cout << "Usage: route <flight_no> <from> <to> <dep HH:MM> <arr HH:MM> <aircraft_id> "
                             "<overbooking> <start> <end>\n";
                continue;
            }
            r.end_date = end_date;
            airline::Result<int> n = svc.publish_route(r);
            if (n) std::cout << "OK: " << n.value() << " flight(s) created\n"; else print_error(n.error());
        } else if (cmd == "search") {
            std::string from, to, d1, d2;
            airline::Date start;
            if (!(iss >> from >> to >> d1) || !airline::Date::try_parse(d1, start)) {
                std::cout << "Usage: search <from> <to> <date> [end_date]\n";
                continue;
            }
            std::optional<airline::Date> end;
            if (iss >> d2) {
                airline::Date e;
                if (!airline::Date::try_parse(d2, e)) {
                    std::cout << "Invalid end date\n";
                    continue;
                }
                end = e;
            }
            airline::Result<std::vector<airline::FlightSummary>> flights = svc.search_flights(from, to, start, end);
            if (!flights) {
                print_error(flights.error());
                continue;
            }
            if (flights.value().empty()) std::cout << "No flights found\n";
            for (const auto& f : flights.value()) {
                std::cout << "Flight " << f.flight_number << " on " << f.flight_date.to_string() << " "
                          << f.departure_time.to_string() << " -> " << f.arrival_time.to_string() << ", "
                          << f.available_tickets << " ticket(s) left\n";
            }
        } else if (cmd == "seats") {
            int flight_no = -1;
            std::string d;
            airline::Date date;
            if (!(iss >> flight_no >> d) || !airline::Date::try_parse(d, date)) {
                std::cout << "Usage: seats <flight_no> <date>\n";
                continue;
            }
            airline::Result<std::vector<int>> seats = svc.available_seats(flight_no, date);
            if (!seats) {
                print_error(seats.error());
                continue;
            }
            const std::vector<int>& s = seats.value();
            std::cout << "Available seats (" << s.size() << "): ";
            for (std::size_t i = 0; i < s.size(); ++i) {
                std::cout << s[i] << (i + 1 < s.size() ? ", " : "");
            }
            std::cout << "\n";
        } else if (cmd == "book") {
            int customer = -1;
            if (!(iss >> customer)) {
                std::cout << "Usage: book <customer_id> <flight_no> <date>[:seat] ...\n";
                continue;
            }
            std::vector<airline::LegRequest> legs;
            bool ok = true;
            airline::LegRequest leg;
            std::string d;
            while (iss >> leg.flight_number) {
                if (!(iss >> d) || !parse_leg_date(d, leg.flight_date, leg.preferred_seat)) {
                    ok = false;
                    break;
                }
                legs.push_back(leg);
            }
            if (!ok) {
                std::cout << "Usage: book <customer_id> <flight_no> <date>[:seat] ...\n";
                continue;
            }
            airline::Result<airline::BookingResult> r = svc.book_tickets(customer, legs);
            if (!r) {
                print_error(r.error());
                continue;
            }
            std::cout << "OK: " << r.value().booking_status << "\n";
            for (const auto& l : r.value().legs) {
                std::cout << "  ticket " << l.ticket_id << ": " << l.flight_details << ", seat "
                          << (l.seat_number ? std::to_string(*l.seat_number) : std::string("Not Selected")) << "\n";
            }
        } else if (cmd == "seat") {
            int customer = -1, flight_no = -1, seat = -1;
            std::string d;
            airline::Date date;
            if (!(iss >> customer >> flight_no >> d >> seat) || !airline::Date::try_parse(d, date)) {
                std::cout << "Usage: seat <customer_id> <flight_no> <date> <seat>\n";
                continue;
            }
            airline::Result<bool> r = svc.book_seat(customer, flight_no, date, seat);
            if (r) std::cout << "OK: seat " << seat << " booked\n"; else print_error(r.error());
        } else if (cmd == "release") {
            int ticket = -1;
            if (!(iss >> ticket)) {
                std::cout << "Usage: release <ticket_id>\n";
                continue;
            }
            airline::Status st = svc.release_ticket(ticket);
            if (st) std::cout << "OK: ticket " << ticket << " released\n"; else print_error(st.error());
        } else if (cmd == "history") {
            int customer = -1;
            iss >> customer;
            airline::Result<std::vector<airline::BookingHistoryRow>> rows = svc.history(customer);
            if (!rows) {
                print_error(rows.error());
                continue;
            }
            if (rows.value().empty()) std::cout << "No bookings for customer_id=" << customer << "\n";
            for (const auto& h : rows.value()) {
                std::cout << h.flight_date.to_string() << "  Flight " << h.flight_number << " "
                          << h.departure_city << " -> " << h.destination_city << " "
                          << h.departure_time.to_string() << "-" << h.arrival_time.to_string()
                          << "  seat " << h.seat_number << "\n";
            }
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }

    return 0;
}
