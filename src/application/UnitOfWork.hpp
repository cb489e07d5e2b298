/**
 * @file UnitOfWork.hpp
 * @brief One store transaction per tracker operation.
 */

#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "domain/FactSet.hpp"
#include "domain/events/TaskEvents.hpp"
#include "domain/repositories/FactStore.hpp"
#include "domain/services/InvariantGuard.hpp"

namespace taskwalker::application {

/**
 * @struct Transaction
 * @brief Working copy handed to an operation body. Discarded if the body throws.
 */
struct Transaction {
    domain::FactSet& facts;
    domain::EventLog& events;
};

/**
 * @class UnitOfWork
 * @brief Lock, load, mutate a private copy, guard, commit.
 *
 * Nothing reaches the store unless the body returns normally and the
 * InvariantGuard accepts the resulting facts, so compound operations
 * (switch, finish-and-start-next) have no intermediate commit point.
 */
class UnitOfWork {
public:
    explicit UnitOfWork(std::shared_ptr<domain::FactStore> store)
        : m_store(std::move(store)) {}

    template <typename Fn>
    auto execute(Fn&& body) {
        auto lock = m_store->acquireWriteLock();
        domain::FactSet facts = m_store->load();
        domain::EventLog events;
        Transaction tx{facts, events};

        using Result = std::invoke_result_t<Fn&, Transaction&>;
        if constexpr (std::is_void_v<Result>) {
            body(tx);
            commit(facts, events);
        } else {
            Result result = body(tx);
            commit(facts, events);
            return result;
        }
    }

    /** @brief Last committed state, for read-only queries. */
    domain::FactSet read() const { return m_store->load(); }

private:
    void commit(const domain::FactSet& facts, const domain::EventLog& events) {
        domain::InvariantGuard::Validate(facts);
        m_store->commit(facts, events);
    }

    std::shared_ptr<domain::FactStore> m_store;
};

} // namespace taskwalker::application
