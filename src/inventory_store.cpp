#include "airline/inventory_store.hpp"

namespace airline {

TransactionGuard::~TransactionGuard() {
    if (active_) {
        // If this fails the pool rolls the connection back again on release
        session_.rollback();
    }
}

Status TransactionGuard::begin() {
    Status st = session_.begin();
    active_ = st.ok();
    return st;
}

Status TransactionGuard::commit() {
    Status st = session_.commit();
    if (st.ok()) active_ = false;
    return st;
}

Status TransactionGuard::rollback() {
    active_ = false;
    return session_.rollback();
}

} // namespace airline
