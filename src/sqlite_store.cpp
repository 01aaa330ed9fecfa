#include "airline/sqlite_store.hpp"

#include <chrono>
#include <memory>
#include <utility>

namespace airline {

namespace {

const char* kSchemaSql = R"SQL(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS aircraft (
    aircraft_id INTEGER PRIMARY KEY,
    capacity    INTEGER NOT NULL CHECK (capacity > 0)
);

CREATE TABLE IF NOT EXISTS flight_route (
    flight_number    INTEGER PRIMARY KEY,
    departure_city   TEXT    NOT NULL,
    destination_city TEXT    NOT NULL,
    departure_time   TEXT    NOT NULL,
    arrival_time     TEXT    NOT NULL,
    aircraft_id      INTEGER NOT NULL,
    overbooking      REAL    NOT NULL DEFAULT 0.0,
    start_date       TEXT    NOT NULL,
    end_date         TEXT,
    FOREIGN KEY(aircraft_id) REFERENCES aircraft(aircraft_id)
        ON UPDATE CASCADE ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS flight (
    flight_id         INTEGER PRIMARY KEY AUTOINCREMENT,
    flight_number     INTEGER NOT NULL,
    flight_date       TEXT    NOT NULL,
    available_tickets INTEGER NOT NULL CHECK (available_tickets >= 0),
    version           INTEGER NOT NULL DEFAULT 1,
    UNIQUE(flight_number, flight_date),
    FOREIGN KEY(flight_number) REFERENCES flight_route(flight_number)
        ON UPDATE CASCADE ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS seat_info (
    flight_id   INTEGER NOT NULL,
    seat_number INTEGER NOT NULL,
    seat_status TEXT    NOT NULL DEFAULT 'AVAILABLE'
        CHECK (seat_status IN ('AVAILABLE', 'BOOKED', 'UNAVAILABLE')),
    version     INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY(flight_id, seat_number),
    FOREIGN KEY(flight_id) REFERENCES flight(flight_id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS ticket (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    customer_id   INTEGER NOT NULL,
    flight_id     INTEGER NOT NULL,
    seat_number   INTEGER,
    flight_date   TEXT    NOT NULL,
    flight_number INTEGER NOT NULL,
    UNIQUE(customer_id, flight_id),
    FOREIGN KEY(flight_id) REFERENCES flight(flight_id) ON DELETE CASCADE,
    FOREIGN KEY(flight_id, seat_number) REFERENCES seat_info(flight_id, seat_number)
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_ticket_flight_seat
    ON ticket(flight_id, seat_number) WHERE seat_number IS NOT NULL;

CREATE INDEX IF NOT EXISTS idx_ticket_customer ON ticket(customer_id);
)SQL";

Error sqlite_error(sqlite3* db, const std::string& what) {
    return database_error(what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

bool is_unique_violation(sqlite3* db) {
    const int ext = sqlite3_extended_errcode(db);
    return ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY;
}

/**
 * @brief Prepared statement that finalizes itself.
 *
 * The first failing prepare or bind is remembered and reported by step(),
 * so call sites can bind unconditionally and check once.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, int value) {
        if (rc_ == SQLITE_OK) rc_ = sqlite3_bind_int(stmt_, idx, value);
        return *this;
    }
    Statement& bind(int idx, double value) {
        if (rc_ == SQLITE_OK) rc_ = sqlite3_bind_double(stmt_, idx, value);
        return *this;
    }
    Statement& bind(int idx, const std::string& value) {
        if (rc_ == SQLITE_OK) rc_ = sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }
    Statement& bind(int idx, const std::optional<int>& value) {
        if (rc_ != SQLITE_OK) return *this;
        rc_ = value ? sqlite3_bind_int(stmt_, idx, *value) : sqlite3_bind_null(stmt_, idx);
        return *this;
    }
    Statement& bind_null(int idx) {
        if (rc_ == SQLITE_OK) rc_ = sqlite3_bind_null(stmt_, idx);
        return *this;
    }

    /** @brief SQLITE_ROW, SQLITE_DONE or an error code. */
    int step() {
        if (rc_ != SQLITE_OK) return rc_;
        return sqlite3_step(stmt_);
    }

    /** @brief Rewinds the statement and clears bindings so it can run again. */
    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int column_int(int col) const { return sqlite3_column_int(stmt_, col); }
    bool column_is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

bool read_date(const Statement& st, int col, Date& out) {
    return Date::try_parse(st.column_text(col), out);
}

bool read_time(const Statement& st, int col, TimeOfDay& out) {
    return TimeOfDay::try_parse(st.column_text(col), out);
}

// Columns: flight_id, flight_number, flight_date, available_tickets, version
Result<Flight> read_flight(const Statement& st) {
    Flight f;
    f.id = st.column_int(0);
    f.flight_number = st.column_int(1);
    if (!read_date(st, 2, f.flight_date)) {
        return database_error("corrupt flight_date for flight " + std::to_string(f.id));
    }
    f.available_tickets = st.column_int(3);
    f.version = st.column_int(4);
    return f;
}

// Columns: id, customer_id, flight_id, seat_number, flight_date, flight_number
Result<Ticket> read_ticket(const Statement& st) {
    Ticket t;
    t.id = st.column_int(0);
    t.customer_id = st.column_int(1);
    t.flight_id = st.column_int(2);
    if (!st.column_is_null(3)) t.seat_number = st.column_int(3);
    if (!read_date(st, 4, t.flight_date)) {
        return database_error("corrupt flight_date for ticket " + std::to_string(t.id));
    }
    t.flight_number = st.column_int(5);
    return t;
}

} // namespace

// ---------- SqliteSession ----------

/**
 * @brief Session over one pooled connection.
 */
class SqliteSession : public StoreSession {
public:
    SqliteSession(SqliteInventoryStore& store, sqlite3* db) : store_(store), db_(db) {}
    ~SqliteSession() override { store_.release_connection(db_); }

    Status begin() override { return exec("BEGIN IMMEDIATE"); }
    Status commit() override { return exec("COMMIT"); }
    Status rollback() override { return exec("ROLLBACK"); }

    Result<std::optional<Flight>> find_flight(FlightNumber flight_number, const Date& date) override {
        Statement st(db_,
            "SELECT flight_id, flight_number, flight_date, available_tickets, version "
            "FROM flight WHERE flight_number = ? AND flight_date = ?");
        st.bind(1, flight_number).bind(2, date.to_string());
        return fetch_flight(st, "find_flight");
    }

    Result<std::optional<Flight>> find_flight_by_id(FlightId flight_id) override {
        Statement st(db_,
            "SELECT flight_id, flight_number, flight_date, available_tickets, version "
            "FROM flight WHERE flight_id = ?");
        st.bind(1, flight_id);
        return fetch_flight(st, "find_flight_by_id");
    }

    Result<int> decrement_tickets_if_version(FlightId flight_id, int expected_version) override {
        Statement st(db_,
            "UPDATE flight SET available_tickets = available_tickets - 1, version = version + 1 "
            "WHERE flight_id = ? AND version = ? AND available_tickets > 0");
        st.bind(1, flight_id).bind(2, expected_version);
        return run_update(st, "decrement_tickets_if_version");
    }

    Result<int> increment_tickets(FlightId flight_id) override {
        Statement st(db_,
            "UPDATE flight SET available_tickets = available_tickets + 1, version = version + 1 "
            "WHERE flight_id = ?");
        st.bind(1, flight_id);
        return run_update(st, "increment_tickets");
    }

    Result<std::optional<TicketId>> insert_ticket(const Ticket& ticket) override {
        Statement st(db_,
            "INSERT INTO ticket (customer_id, flight_id, seat_number, flight_date, flight_number) "
            "VALUES (?, ?, ?, ?, ?)");
        st.bind(1, ticket.customer_id)
          .bind(2, ticket.flight_id)
          .bind(3, ticket.seat_number)
          .bind(4, ticket.flight_date.to_string())
          .bind(5, ticket.flight_number);

        const int rc = st.step();
        if (rc == SQLITE_DONE) {
            return std::optional<TicketId>(static_cast<TicketId>(sqlite3_last_insert_rowid(db_)));
        }
        if ((rc & 0xFF) == SQLITE_CONSTRAINT && is_unique_violation(db_)) {
            return std::optional<TicketId>();
        }
        return sqlite_error(db_, "insert_ticket");
    }

    Result<std::optional<Ticket>> find_ticket(TicketId ticket_id) override {
        Statement st(db_,
            "SELECT id, customer_id, flight_id, seat_number, flight_date, flight_number "
            "FROM ticket WHERE id = ?");
        st.bind(1, ticket_id);
        return fetch_ticket(st, "find_ticket");
    }

    Result<std::optional<Ticket>> find_customer_ticket(CustomerId customer_id, FlightId flight_id) override {
        Statement st(db_,
            "SELECT id, customer_id, flight_id, seat_number, flight_date, flight_number "
            "FROM ticket WHERE customer_id = ? AND flight_id = ?");
        st.bind(1, customer_id).bind(2, flight_id);
        return fetch_ticket(st, "find_customer_ticket");
    }

    Result<int> delete_ticket(TicketId ticket_id) override {
        Statement st(db_, "DELETE FROM ticket WHERE id = ?");
        st.bind(1, ticket_id);
        return run_update(st, "delete_ticket");
    }

    Result<int> set_ticket_seat(CustomerId customer_id, FlightId flight_id, int seat_number) override {
        Statement st(db_, "UPDATE ticket SET seat_number = ? WHERE customer_id = ? AND flight_id = ?");
        st.bind(1, seat_number).bind(2, customer_id).bind(3, flight_id);
        return run_update(st, "set_ticket_seat");
    }

    Result<std::optional<Seat>> find_seat(FlightId flight_id, int seat_number) override {
        Statement st(db_,
            "SELECT flight_id, seat_number, seat_status, version "
            "FROM seat_info WHERE flight_id = ? AND seat_number = ?");
        st.bind(1, flight_id).bind(2, seat_number);

        const int rc = st.step();
        if (rc == SQLITE_DONE) return std::optional<Seat>();
        if (rc != SQLITE_ROW) return sqlite_error(db_, "find_seat");

        Seat s;
        s.flight_id = st.column_int(0);
        s.seat_number = st.column_int(1);
        if (!try_parse_seat_status(st.column_text(2), s.status)) {
            return database_error("corrupt seat_status for seat " + std::to_string(s.seat_number));
        }
        s.version = st.column_int(3);
        return std::optional<Seat>(s);
    }

    Result<int> book_seat_if_version(FlightId flight_id, int seat_number, int expected_version) override {
        Statement st(db_,
            "UPDATE seat_info SET seat_status = 'BOOKED', version = version + 1 "
            "WHERE flight_id = ? AND seat_number = ? AND version = ? AND seat_status = 'AVAILABLE'");
        st.bind(1, flight_id).bind(2, seat_number).bind(3, expected_version);
        return run_update(st, "book_seat_if_version");
    }

    Result<int> release_seat(FlightId flight_id, int seat_number) override {
        Statement st(db_,
            "UPDATE seat_info SET seat_status = 'AVAILABLE', version = version + 1 "
            "WHERE flight_id = ? AND seat_number = ?");
        st.bind(1, flight_id).bind(2, seat_number);
        return run_update(st, "release_seat");
    }

    Result<std::vector<int>> list_available_seats(FlightId flight_id) override {
        Statement st(db_,
            "SELECT seat_number FROM seat_info "
            "WHERE flight_id = ? AND seat_status = 'AVAILABLE' ORDER BY seat_number");
        st.bind(1, flight_id);

        std::vector<int> seats;
        int rc;
        while ((rc = st.step()) == SQLITE_ROW) {
            seats.push_back(st.column_int(0));
        }
        if (rc != SQLITE_DONE) return sqlite_error(db_, "list_available_seats");
        return seats;
    }

    Result<std::vector<BookingHistoryRow>> customer_history(CustomerId customer_id) override {
        Statement st(db_,
            "SELECT f.flight_number, t.seat_number, fr.departure_city, fr.destination_city, "
            "       f.flight_date, fr.departure_time, fr.arrival_time "
            "FROM ticket t "
            "INNER JOIN flight f ON t.flight_id = f.flight_id "
            "INNER JOIN flight_route fr ON f.flight_number = fr.flight_number "
            "WHERE t.customer_id = ? "
            "ORDER BY f.flight_date DESC, f.flight_number");
        st.bind(1, customer_id);

        std::vector<BookingHistoryRow> rows;
        int rc;
        while ((rc = st.step()) == SQLITE_ROW) {
            BookingHistoryRow row;
            row.flight_number = st.column_int(0);
            row.seat_number = st.column_is_null(1) ? "Not Selected" : std::to_string(st.column_int(1));
            row.departure_city = st.column_text(2);
            row.destination_city = st.column_text(3);
            if (!read_date(st, 4, row.flight_date) ||
                !read_time(st, 5, row.departure_time) ||
                !read_time(st, 6, row.arrival_time)) {
                return database_error("corrupt date or time in history of customer " +
                                      std::to_string(customer_id));
            }
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) return sqlite_error(db_, "customer_history");
        return rows;
    }

    Result<std::vector<FlightSummary>> search_flights(const std::string& departure_city,
                                                      const std::string& destination_city,
                                                      const Date& from,
                                                      const Date& to) override {
        Statement st(db_,
            "SELECT f.flight_id, f.flight_number, fr.departure_city, fr.destination_city, "
            "       fr.departure_time, fr.arrival_time, f.available_tickets, f.flight_date "
            "FROM flight f "
            "JOIN flight_route fr ON f.flight_number = fr.flight_number "
            "WHERE fr.departure_city = ? AND fr.destination_city = ? "
            "AND f.flight_date BETWEEN ? AND ? "
            "AND f.available_tickets > 0 "
            "ORDER BY f.flight_date, f.flight_number");
        st.bind(1, departure_city).bind(2, destination_city).bind(3, from.to_string()).bind(4, to.to_string());

        std::vector<FlightSummary> out;
        int rc;
        while ((rc = st.step()) == SQLITE_ROW) {
            FlightSummary s;
            s.flight_id = st.column_int(0);
            s.flight_number = st.column_int(1);
            s.departure_city = st.column_text(2);
            s.destination_city = st.column_text(3);
            s.available_tickets = st.column_int(6);
            if (!read_time(st, 4, s.departure_time) ||
                !read_time(st, 5, s.arrival_time) ||
                !read_date(st, 7, s.flight_date)) {
                return database_error("corrupt date or time for flight " + std::to_string(s.flight_id));
            }
            out.push_back(std::move(s));
        }
        if (rc != SQLITE_DONE) return sqlite_error(db_, "search_flights");
        return out;
    }

    Status insert_aircraft(const Aircraft& aircraft) override {
        Statement st(db_, "INSERT INTO aircraft (aircraft_id, capacity) VALUES (?, ?)");
        st.bind(1, aircraft.id).bind(2, aircraft.capacity);
        const int rc = st.step();
        if (rc == SQLITE_DONE) return Status();
        if ((rc & 0xFF) == SQLITE_CONSTRAINT && is_unique_violation(db_)) {
            return validation_error("Aircraft " + std::to_string(aircraft.id) + " is already registered");
        }
        return sqlite_error(db_, "insert_aircraft");
    }

    Result<std::optional<Aircraft>> find_aircraft(AircraftId aircraft_id) override {
        Statement st(db_, "SELECT aircraft_id, capacity FROM aircraft WHERE aircraft_id = ?");
        st.bind(1, aircraft_id);
        const int rc = st.step();
        if (rc == SQLITE_DONE) return std::optional<Aircraft>();
        if (rc != SQLITE_ROW) return sqlite_error(db_, "find_aircraft");
        return std::optional<Aircraft>(Aircraft{st.column_int(0), st.column_int(1)});
    }

    Status insert_route(const FlightRoute& route) override {
        Statement st(db_,
            "INSERT INTO flight_route (flight_number, departure_city, destination_city, "
            "departure_time, arrival_time, aircraft_id, overbooking, start_date, end_date) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        st.bind(1, route.flight_number)
          .bind(2, route.departure_city)
          .bind(3, route.destination_city)
          .bind(4, route.departure_time.to_string())
          .bind(5, route.arrival_time.to_string())
          .bind(6, route.aircraft_id)
          .bind(7, route.overbooking)
          .bind(8, route.start_date.to_string());
        if (route.end_date) {
            st.bind(9, route.end_date->to_string());
        } else {
            st.bind_null(9);
        }

        const int rc = st.step();
        if (rc == SQLITE_DONE) return Status();
        if ((rc & 0xFF) == SQLITE_CONSTRAINT && is_unique_violation(db_)) {
            return validation_error("Flight route " + std::to_string(route.flight_number) + " already exists");
        }
        return sqlite_error(db_, "insert_route");
    }

    Result<FlightId> insert_flight(FlightNumber flight_number, const Date& date, int available_tickets) override {
        Statement st(db_,
            "INSERT INTO flight (flight_number, flight_date, available_tickets, version) "
            "VALUES (?, ?, ?, 1)");
        st.bind(1, flight_number).bind(2, date.to_string()).bind(3, available_tickets);
        if (st.step() != SQLITE_DONE) return sqlite_error(db_, "insert_flight");
        return static_cast<FlightId>(sqlite3_last_insert_rowid(db_));
    }

    Status insert_seats(FlightId flight_id, int seat_count) override {
        Statement st(db_,
            "INSERT INTO seat_info (flight_id, seat_number, seat_status, version) "
            "VALUES (?, ?, 'AVAILABLE', 0)");
        for (int seat = 1; seat <= seat_count; ++seat) {
            st.bind(1, flight_id).bind(2, seat);
            if (st.step() != SQLITE_DONE) return sqlite_error(db_, "insert_seats");
            st.reset();
        }
        return Status();
    }

private:
    Status exec(const char* sql) {
        char* errmsg = nullptr;
        const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = std::string(sql) + ": " + (errmsg ? errmsg : sqlite3_errmsg(db_));
            if (errmsg) sqlite3_free(errmsg);
            return database_error(msg);
        }
        return Status();
    }

    Result<int> run_update(Statement& st, const char* what) {
        if (st.step() != SQLITE_DONE) return sqlite_error(db_, what);
        return sqlite3_changes(db_);
    }

    Result<std::optional<Flight>> fetch_flight(Statement& st, const char* what) {
        const int rc = st.step();
        if (rc == SQLITE_DONE) return std::optional<Flight>();
        if (rc != SQLITE_ROW) return sqlite_error(db_, what);
        Result<Flight> f = read_flight(st);
        if (!f) return f.error();
        return std::optional<Flight>(f.value());
    }

    Result<std::optional<Ticket>> fetch_ticket(Statement& st, const char* what) {
        const int rc = st.step();
        if (rc == SQLITE_DONE) return std::optional<Ticket>();
        if (rc != SQLITE_ROW) return sqlite_error(db_, what);
        Result<Ticket> t = read_ticket(st);
        if (!t) return t.error();
        return std::optional<Ticket>(t.value());
    }

    SqliteInventoryStore& store_;
    sqlite3* db_;
};

// ---------- SqliteInventoryStore ----------

SqliteInventoryStore::SqliteInventoryStore(SqliteStoreOptions options) : options_(std::move(options)) {}

SqliteInventoryStore::~SqliteInventoryStore() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (sqlite3* db : idle_) {
        sqlite3_close(db);
    }
    idle_.clear();
}

Status SqliteInventoryStore::init_schema() {
    // DDL runs on a private connection outside the pool
    Result<sqlite3*> conn = open_connection();
    if (!conn) return conn.error();
    sqlite3* db = conn.value();

    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
        rc = sqlite3_exec(db, kSchemaSql, nullptr, nullptr, &errmsg);
    }

    Status st;
    if (rc != SQLITE_OK) {
        st = database_error(std::string("init_schema: ") + (errmsg ? errmsg : sqlite3_errmsg(db)));
    }
    if (errmsg) sqlite3_free(errmsg);
    sqlite3_close(db);
    return st;
}

Result<sqlite3*> SqliteInventoryStore::open_connection() {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(options_.path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        Error err = sqlite_error(db, "cannot open " + options_.path);
        sqlite3_close(db);
        return err;
    }

    sqlite3_busy_timeout(db, options_.busy_timeout_ms);

    char* errmsg = nullptr;
    if (sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
        Error err = database_error(std::string("cannot enable foreign keys: ") +
                                   (errmsg ? errmsg : sqlite3_errmsg(db)));
        if (errmsg) sqlite3_free(errmsg);
        sqlite3_close(db);
        return err;
    }
    return db;
}

Result<sqlite3*> SqliteInventoryStore::acquire_connection() {
    std::unique_lock<std::mutex> lock(mtx_);
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options_.acquire_timeout_ms);

    while (idle_.empty() && open_count_ >= options_.pool_size) {
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && open_count_ >= options_.pool_size) {
            return database_error("timed out waiting for a store connection");
        }
    }

    if (!idle_.empty()) {
        sqlite3* db = idle_.back();
        idle_.pop_back();
        return db;
    }

    // Reserve the slot, then open outside the lock
    ++open_count_;
    lock.unlock();

    Result<sqlite3*> db = open_connection();
    if (!db) {
        lock.lock();
        --open_count_;
        cv_.notify_one();
    }
    return db;
}

void SqliteInventoryStore::release_connection(sqlite3* db) {
    // A session dropped mid-transaction must not leak its write lock
    if (!sqlite3_get_autocommit(db) &&
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        std::lock_guard<std::mutex> lock(mtx_);
        --open_count_;
        cv_.notify_one();
        return;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    idle_.push_back(db);
    cv_.notify_one();
}

Result<std::unique_ptr<StoreSession>> SqliteInventoryStore::open_session() {
    Result<sqlite3*> db = acquire_connection();
    if (!db) return db.error();
    return std::unique_ptr<StoreSession>(std::make_unique<SqliteSession>(*this, db.value()));
}

} // namespace airline
