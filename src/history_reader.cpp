#include "airline/history_reader.hpp"

namespace airline {

Result<std::vector<BookingHistoryRow>> HistoryReader::history(CustomerId customer_id) {
    Result<std::unique_ptr<StoreSession>> lease = store_.open_session();
    if (!lease) return lease.error();
    return lease.value()->customer_history(customer_id);
}

} // namespace airline
