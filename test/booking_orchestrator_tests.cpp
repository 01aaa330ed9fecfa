#include <gtest/gtest.h>

#include "test_support.hpp"

#include "airline/booking_orchestrator.hpp"

using namespace airline_test;

namespace {

class BookingOrchestratorTest : public InventoryTest {
protected:
    void SetUp() override {
        InventoryTest::SetUp();
        seats_ = std::make_unique<SeatAllocator>(*store_, logger_);
        tickets_ = std::make_unique<TicketAllocator>(*store_, *seats_, logger_);
        orchestrator_ = std::make_unique<BookingOrchestrator>(*tickets_, *seats_, logger_);
        date_ = make_date("2024-12-08");
    }

    std::unique_ptr<SeatAllocator> seats_;
    std::unique_ptr<TicketAllocator> tickets_;
    std::unique_ptr<BookingOrchestrator> orchestrator_;
    Date date_;
};

// ---------- Tests: success ----------
TEST_F(BookingOrchestratorTest, SingleLegWithoutSeatIsConfirmed) {
    publish_flight(100, 5, date_);

    Result<BookingResult> r = orchestrator_->book_tickets(1, {LegRequest{100, date_, std::nullopt}});
    ASSERT_TRUE(r.ok()) << describe(r);
    EXPECT_EQ(r.value().booking_status, kBookingConfirmed);
    EXPECT_TRUE(r.value().fully_confirmed());
    ASSERT_EQ(r.value().legs.size(), 1u);
    EXPECT_EQ(r.value().legs[0].flight_details, "Flight 100 on 2024-12-08");
    EXPECT_FALSE(r.value().legs[0].seat_number.has_value());
    EXPECT_FALSE(r.value().legs[0].seat_unavailable);
}

TEST_F(BookingOrchestratorTest, TwoLegsWithPreferredSeats) {
    const Flight a = publish_flight(100, 5, date_);
    const Flight b = publish_flight(200, 5, date_, "London", "Paris");

    Result<BookingResult> r = orchestrator_->book_tickets(1, {LegRequest{100, date_, 2}, LegRequest{200, date_, 3}});
    ASSERT_TRUE(r.ok()) << describe(r);
    EXPECT_EQ(r.value().booking_status, kBookingConfirmed);
    ASSERT_EQ(r.value().legs.size(), 2u);
    EXPECT_EQ(r.value().legs[0].seat_number, std::optional<int>(2));
    EXPECT_EQ(r.value().legs[1].seat_number, std::optional<int>(3));
    EXPECT_EQ(load_seat(a.id, 2).status, SeatStatus::Booked);
    EXPECT_EQ(load_seat(b.id, 3).status, SeatStatus::Booked);
}

TEST_F(BookingOrchestratorTest, TakenPreferredSeatStillBooksTicket) {
    const Flight f = publish_flight(100, 5, date_);
    ASSERT_TRUE(orchestrator_->book_tickets(1, {LegRequest{100, date_, 2}}).ok());

    Result<BookingResult> r = orchestrator_->book_tickets(2, {LegRequest{100, date_, 2}});
    ASSERT_TRUE(r.ok()) << describe(r);
    EXPECT_EQ(r.value().booking_status, kBookingSeatUnavailable);
    EXPECT_FALSE(r.value().fully_confirmed());
    ASSERT_EQ(r.value().legs.size(), 1u);
    EXPECT_TRUE(r.value().legs[0].seat_unavailable);
    EXPECT_FALSE(r.value().legs[0].seat_number.has_value());

    EXPECT_EQ(load_flight(100, date_).available_tickets, f.available_tickets - 2);
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM ticket WHERE customer_id = 2 AND seat_number IS NULL"), 1);
}

TEST_F(BookingOrchestratorTest, EmptyRequestIsBadRequest) {
    Result<BookingResult> r = orchestrator_->book_tickets(1, {});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::BadRequest);
}

// ---------- Tests: compensation ----------
TEST_F(BookingOrchestratorTest, SecondLegFullyBookedRollsBackFirstLeg) {
    const Flight a = publish_flight(100, 5, date_);
    publish_flight(200, 1, date_, "London", "Paris");
    ASSERT_TRUE(orchestrator_->book_tickets(99, {LegRequest{200, date_, std::nullopt}}).ok());

    const Flight a_before = load_flight(100, date_);
    const Seat seat_before = load_seat(a.id, 3);

    Result<BookingResult> r = orchestrator_->book_tickets(1, {LegRequest{100, date_, 3}, LegRequest{200, date_, std::nullopt}});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::ValidationError);
    ASSERT_TRUE(r.error().cause != nullptr);
    EXPECT_EQ(r.error().cause->message, "This flight is fully booked.");
    EXPECT_TRUE(r.error().compensation_failures.empty());

    // Quota and seat status are back; versions moved forward
    const Flight a_after = load_flight(100, date_);
    EXPECT_EQ(a_after.available_tickets, a_before.available_tickets);
    EXPECT_EQ(a_after.version, a_before.version + 2);
    const Seat seat_after = load_seat(a.id, 3);
    EXPECT_EQ(seat_after.status, seat_before.status);
    EXPECT_EQ(seat_after.version, seat_before.version + 2);
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM ticket WHERE customer_id = 1"), 0);
}

TEST_F(BookingOrchestratorTest, RollbackUndoesEveryBookedLeg) {
    publish_flight(100, 5, date_);
    publish_flight(200, 5, date_, "London", "Paris");

    Result<BookingResult> r = orchestrator_->book_tickets(
        1, {LegRequest{100, date_, std::nullopt}, LegRequest{200, date_, std::nullopt},
            LegRequest{300, date_, std::nullopt}});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::ValidationError);
    ASSERT_TRUE(r.error().cause != nullptr);
    EXPECT_EQ(r.error().cause->kind, ErrorKind::NotFound);

    EXPECT_EQ(load_flight(100, date_).available_tickets, 5);
    EXPECT_EQ(load_flight(200, date_).available_tickets, 5);
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM ticket"), 0);
}

TEST_F(BookingOrchestratorTest, SameFlightTwiceInOneRequestIsRolledBack) {
    publish_flight(100, 5, date_);

    Result<BookingResult> r = orchestrator_->book_tickets(
        1, {LegRequest{100, date_, std::nullopt}, LegRequest{100, date_, std::nullopt}});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::ValidationError);
    EXPECT_EQ(load_flight(100, date_).available_tickets, 5);
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM ticket"), 0);
}

TEST_F(BookingOrchestratorTest, UndoOfAlreadyReleasedTicketCountsAsDone) {
    publish_flight(100, 5, date_);
    publish_flight(200, 1, date_, "London", "Paris");
    ASSERT_TRUE(orchestrator_->book_tickets(99, {LegRequest{200, date_, std::nullopt}}).ok());
    const Flight before = load_flight(100, date_);

    // The caller abandons leg one through the public release path just before leg two is tried
    bool released = false;
    FaultyStore hooked(*store_, [&](std::unique_ptr<StoreSession> s) -> std::unique_ptr<StoreSession> {
        return std::make_unique<FlightLookupHookSession>(std::move(s), 200, [&] {
            if (released) return;
            released = true;
            const int ticket_id = query_int("SELECT id FROM ticket WHERE customer_id = 1");
            Status st = tickets_->release(ticket_id);
            EXPECT_TRUE(st.ok()) << describe(st);
        });
    });
    SeatAllocator seats(hooked, logger_);
    TicketAllocator tickets(hooked, seats, logger_);
    BookingOrchestrator orchestrator(tickets, seats, logger_, RetryPolicy{3, 0, 0});

    Result<BookingResult> r = orchestrator.book_tickets(1, {LegRequest{100, date_, std::nullopt},
                                                            LegRequest{200, date_, std::nullopt}});
    ASSERT_TRUE(released);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::ValidationError);
    EXPECT_TRUE(r.error().compensation_failures.empty());

    // Quota came back exactly once: one decrement, one increment
    const Flight after = load_flight(100, date_);
    EXPECT_EQ(after.available_tickets, before.available_tickets);
    EXPECT_EQ(after.version, before.version + 2);
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM ticket WHERE customer_id = 1"), 0);
}

TEST_F(BookingOrchestratorTest, FailedCompensationIsReportedSeparatelyFromCause) {
    publish_flight(100, 5, date_);
    publish_flight(200, 1, date_, "London", "Paris");
    ASSERT_TRUE(orchestrator_->book_tickets(99, {LegRequest{200, date_, std::nullopt}}).ok());

    std::atomic<int> calls{0};
    FaultyStore broken(*store_, [&](std::unique_ptr<StoreSession> s) -> std::unique_ptr<StoreSession> {
        return std::make_unique<BrokenReleaseSession>(std::move(s), calls);
    });
    SeatAllocator seats(broken, logger_);
    TicketAllocator tickets(broken, seats, logger_);
    BookingOrchestrator orchestrator(tickets, seats, logger_, RetryPolicy{3, 0, 0});

    Result<BookingResult> r = orchestrator.book_tickets(1, {LegRequest{100, date_, std::nullopt},
                                                            LegRequest{200, date_, std::nullopt}});
    ASSERT_FALSE(r.ok());
    const Error& err = r.error();
    EXPECT_EQ(err.kind, ErrorKind::CompensationFailed);

    ASSERT_TRUE(err.cause != nullptr);
    EXPECT_EQ(err.cause->kind, ErrorKind::ValidationError);
    EXPECT_EQ(err.cause->message, "This flight is fully booked.");

    ASSERT_EQ(err.compensation_failures.size(), 1u);
    EXPECT_EQ(err.compensation_failures[0].kind, ErrorKind::DatabaseError);
    EXPECT_NE(err.to_string().find("disk I/O error"), std::string::npos);

    // Each undo is retried per the compensation policy before giving up
    EXPECT_EQ(calls.load(), 3);
    // The failed release rolled back, so the ticket is still there for a later cleanup
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM ticket WHERE customer_id = 1"), 1);
}

} // namespace
