#include <gtest/gtest.h>

#include "airline/booking_service.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

using namespace airline;

// ---------- Helpers ----------
namespace {

bool contains(const std::vector<int>& v, int seat) {
    return std::find(v.begin(), v.end(), seat) != v.end();
}

Date day(const char* text) {
    Date d;
    EXPECT_TRUE(Date::try_parse(text, d)) << text;
    return d;
}

class BookingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        config_.store.path = ::testing::TempDir() + "airline_service_" + info->name() + ".db";
        config_.store.pool_size = 32;
        config_.store.busy_timeout_ms = 10000;
        config_.log_level = LogLevel::Off;
        remove_files();

        svc_ = std::make_unique<BookingService>(config_);
        Status st = svc_->open();
        ASSERT_TRUE(st.ok()) << st.error().to_string();

        // Flight 101 New York -> London and flight 202 London -> Paris, three days each
        ASSERT_TRUE(svc_->register_aircraft(Aircraft{1, 20}).ok());
        ASSERT_TRUE(svc_->register_aircraft(Aircraft{2, 2}).ok());
        ASSERT_TRUE(svc_->publish_route(route(101, "New York", "London", 1)).ok());
        ASSERT_TRUE(svc_->publish_route(route(202, "London", "Paris", 2)).ok());
    }

    void TearDown() override {
        svc_.reset();
        remove_files();
    }

    FlightRoute route(FlightNumber n, const char* from, const char* to, AircraftId aircraft) {
        FlightRoute r;
        r.flight_number = n;
        r.departure_city = from;
        r.destination_city = to;
        r.departure_time = TimeOfDay{8, 0, 0};
        r.arrival_time = TimeOfDay{16, 30, 0};
        r.aircraft_id = aircraft;
        r.start_date = day("2024-12-08");
        r.end_date = day("2024-12-10");
        return r;
    }

    void remove_files() {
        std::remove(config_.store.path.c_str());
        std::remove((config_.store.path + "-wal").c_str());
        std::remove((config_.store.path + "-shm").c_str());
    }

    EngineConfig config_;
    std::unique_ptr<BookingService> svc_;
};

} // namespace

// ---------- Tests: catalog ----------
TEST_F(BookingServiceTest, SearchFindsPublishedFlights) {
    auto r = svc_->search_flights("New York", "London", day("2024-12-08"), day("2024-12-10"));
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_EQ(r.value()[0].flight_date, day("2024-12-08"));
    EXPECT_EQ(r.value()[2].flight_date, day("2024-12-10"));
    EXPECT_EQ(r.value()[0].available_tickets, 20);
}

TEST_F(BookingServiceTest, InitiallyAllSeatsAvailable) {
    auto seats = svc_->available_seats(101, day("2024-12-09"));
    ASSERT_TRUE(seats.ok());
    ASSERT_EQ(seats.value().size(), 20u);
    EXPECT_TRUE(contains(seats.value(), 1));
    EXPECT_TRUE(contains(seats.value(), 20));
}

// ---------- Tests: booking ----------
TEST_F(BookingServiceTest, ConnectingFlightsWithSeats) {
    auto res = svc_->book_tickets(
        7, {LegRequest{101, day("2024-12-08"), 5}, LegRequest{202, day("2024-12-09"), std::nullopt}});
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().booking_status, kBookingConfirmed);
    ASSERT_EQ(res.value().legs.size(), 2u);
    EXPECT_EQ(res.value().legs[1].flight_details, "Flight 202 on 2024-12-09");

    auto seats = svc_->available_seats(101, day("2024-12-08"));
    ASSERT_TRUE(seats.ok());
    EXPECT_FALSE(contains(seats.value(), 5));

    auto history = svc_->history(7);
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history.value().size(), 2u);
    EXPECT_EQ(history.value()[0].flight_number, 202);
    EXPECT_EQ(history.value()[0].seat_number, "Not Selected");
    EXPECT_EQ(history.value()[1].seat_number, "5");
}

TEST_F(BookingServiceTest, AllOrNothingAcrossFlights) {
    ASSERT_TRUE(svc_->book_tickets(1, {LegRequest{202, day("2024-12-09"), std::nullopt}}).ok());
    ASSERT_TRUE(svc_->book_tickets(2, {LegRequest{202, day("2024-12-09"), std::nullopt}}).ok());

    // Flight 202 is now full, so the first leg must be undone
    auto res = svc_->book_tickets(
        3, {LegRequest{101, day("2024-12-08"), 1}, LegRequest{202, day("2024-12-09"), std::nullopt}});
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(http_status(res.error().kind), 400);

    auto seats = svc_->available_seats(101, day("2024-12-08"));
    ASSERT_TRUE(seats.ok());
    EXPECT_TRUE(contains(seats.value(), 1));
    auto history = svc_->history(3);
    ASSERT_TRUE(history.ok());
    EXPECT_TRUE(history.value().empty());
}

TEST_F(BookingServiceTest, PickChangeAndCancelSeat) {
    auto res = svc_->book_tickets(9, {LegRequest{101, day("2024-12-10"), std::nullopt}});
    ASSERT_TRUE(res.ok());

    ASSERT_TRUE(svc_->book_seat(9, 101, day("2024-12-10"), 12).ok());
    ASSERT_TRUE(svc_->book_seat(9, 101, day("2024-12-10"), 13).ok());

    auto seats = svc_->available_seats(101, day("2024-12-10"));
    ASSERT_TRUE(seats.ok());
    EXPECT_TRUE(contains(seats.value(), 12));
    EXPECT_FALSE(contains(seats.value(), 13));

    ASSERT_TRUE(svc_->release_ticket(res.value().legs[0].ticket_id).ok());
    seats = svc_->available_seats(101, day("2024-12-10"));
    ASSERT_TRUE(seats.ok());
    EXPECT_TRUE(contains(seats.value(), 13));

    auto again = svc_->release_ticket(res.value().legs[0].ticket_id);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(http_status(again.error().kind), 404);
}

TEST_F(BookingServiceTest, RejectEmptyRequest) {
    auto res = svc_->book_tickets(1, {});
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::BadRequest);
}

// ---------- Concurrency test ----------
TEST_F(BookingServiceTest, OnlyOneCustomerGetsTheSameSeat) {
    constexpr int kThreads = 8;
    std::atomic<bool> start{false};
    std::atomic<int> seated{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!start.load()) {
                // spin until start
            }
            auto res = svc_->book_tickets(100 + i, {LegRequest{101, day("2024-12-09"), 1}});
            if (res && res.value().fully_confirmed()) {
                seated.fetch_add(1);
            }
        });
    }

    start.store(true);

    for (auto& t : threads) {
        t.join();
    }

    // Every customer got a ticket, exactly one of them got seat 1
    EXPECT_EQ(seated.load(), 1);
    auto search = svc_->search_flights("New York", "London", day("2024-12-09"));
    ASSERT_TRUE(search.ok());
    ASSERT_EQ(search.value().size(), 1u);
    EXPECT_EQ(search.value()[0].available_tickets, 20 - kThreads);
}
