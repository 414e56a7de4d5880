#pragma once

#include <optional>
#include <utility>

#include "iterator.hpp"
#include "logger.hpp"
#include "singly_linked_list.hpp"

namespace miniiter {

/**
 * @brief Destructively drains a SinglyLinkedList front to back.
 *
 * The consumer takes the list over at construction; the caller's list is
 * left empty. Every Next() pops the front node and yields its payload, so
 * consumed elements cannot be revisited. Nodes still linked when the
 * consumer is destroyed are released with it.
 *
 * @tparam T payload type
 */
template <typename T>
class ListConsumer final : public Iterator<T> {
public:
    explicit ListConsumer(SinglyLinkedList<T>&& list) noexcept
        : list_(std::move(list)) {}

    ListConsumer(ListConsumer&&) noexcept = default;
    ListConsumer& operator=(ListConsumer&&) noexcept = default;

    ~ListConsumer() override {
        if (!list_.Empty()) {
            LOG_DEBUG("ListConsumer released %zu undrained nodes", list_.Len());
        }
    }

    std::optional<T> Next() noexcept override {
        auto node = list_.PopFirst();
        if (!node) {
            return std::nullopt;
        }
        return std::move(node->data);
    }

    // Nodes not yet consumed
    const SinglyLinkedList<T>& List() const noexcept { return list_; }

private:
    SinglyLinkedList<T> list_;
};

} // namespace miniiter
