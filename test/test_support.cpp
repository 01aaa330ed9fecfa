#include "test_support.hpp"

#include "airline/schedule_generator.hpp"

#include <cstdio>

#include <sqlite3.h>

namespace airline_test {

Date make_date(const std::string& text) {
    Date d;
    EXPECT_TRUE(Date::try_parse(text, d)) << text;
    return d;
}

std::string describe(const Status& st) {
    return st.ok() ? "ok" : st.error().to_string();
}

namespace {
void remove_database_files(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}
} // namespace

void InventoryTest::SetUp() {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    options_.path = ::testing::TempDir() + "airline_" + info->test_suite_name() + "_" + info->name() + ".db";
    options_.pool_size = 32;
    options_.busy_timeout_ms = 10000;
    remove_database_files(options_.path);

    store_ = std::make_unique<SqliteInventoryStore>(options_);
    Status st = store_->init_schema();
    ASSERT_TRUE(st.ok()) << describe(st);
}

void InventoryTest::TearDown() {
    store_.reset();
    remove_database_files(options_.path);
}

Flight InventoryTest::publish_flight(FlightNumber flight_number, int capacity, const Date& date,
                                     const std::string& from, const std::string& to) {
    ScheduleGenerator schedule(*store_, logger_);

    // Same id for aircraft and flight number keeps fixtures short
    Status st = schedule.register_aircraft(Aircraft{flight_number, capacity});
    EXPECT_TRUE(st.ok()) << describe(st);

    FlightRoute route;
    route.flight_number = flight_number;
    route.departure_city = from;
    route.destination_city = to;
    route.departure_time = TimeOfDay{10, 0, 0};
    route.arrival_time = TimeOfDay{22, 0, 0};
    route.aircraft_id = flight_number;
    route.start_date = date;
    route.end_date = date;

    Result<int> created = schedule.publish_route(route);
    EXPECT_TRUE(created.ok()) << describe(created);
    return load_flight(flight_number, date);
}

Flight InventoryTest::load_flight(FlightNumber flight_number, const Date& date) {
    Result<std::unique_ptr<StoreSession>> session = store_->open_session();
    EXPECT_TRUE(session.ok()) << describe(session);
    if (!session) return Flight{};

    Result<std::optional<Flight>> flight = session.value()->find_flight(flight_number, date);
    EXPECT_TRUE(flight.ok() && flight.value().has_value()) << describe(flight);
    if (!flight || !flight.value()) return Flight{};
    return *flight.value();
}

Seat InventoryTest::load_seat(FlightId flight_id, int seat_number) {
    Result<std::unique_ptr<StoreSession>> session = store_->open_session();
    EXPECT_TRUE(session.ok()) << describe(session);
    if (!session) return Seat{};

    Result<std::optional<Seat>> seat = session.value()->find_seat(flight_id, seat_number);
    EXPECT_TRUE(seat.ok() && seat.value().has_value()) << describe(seat);
    if (!seat || !seat.value()) return Seat{};
    return *seat.value();
}

int InventoryTest::query_int(const std::string& sql) {
    sqlite3* db = nullptr;
    int value = -1;
    if (sqlite3_open(options_.path.c_str(), &db) == SQLITE_OK) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW) {
            value = sqlite3_column_int(stmt, 0);
        } else {
            ADD_FAILURE() << sql << ": " << sqlite3_errmsg(db);
        }
        sqlite3_finalize(stmt);
    } else {
        ADD_FAILURE() << "cannot open " << options_.path;
    }
    sqlite3_close(db);
    return value;
}

} // namespace airline_test
