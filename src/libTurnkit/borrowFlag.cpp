#include "turnkit/borrowCell.hpp"
#include "turnkit/errors.hpp"

#include <format>

namespace turnkit {

static const char* toString(const BorrowState state) {
	switch (state) {
	case BorrowState::Unused:
		return "unused";
	case BorrowState::Reading:
		return "reading";
	case BorrowState::Writing:
		return "writing";
	}
	return "unknown";
}

void BorrowFlag::acquire(const BorrowState mode) {
	if (!tryAcquire(mode)) {
		throw BorrowError(std::format("Cannot open a {} transaction: game state is already borrowed for {}.", toString(mode), toString(m_state)));
	}
}

bool BorrowFlag::tryAcquire(const BorrowState mode) {
	if (mode == BorrowState::Unused) {
		throw BorrowError("Cannot acquire a transaction without an access mode.");
	}
	if (m_state != BorrowState::Unused) {
		return false;
	}

	m_state = mode;
	return true;
}

void BorrowFlag::release() noexcept {
	m_state = BorrowState::Unused;
}

BorrowState BorrowFlag::state() const noexcept {
	return m_state;
}

} // namespace turnkit
