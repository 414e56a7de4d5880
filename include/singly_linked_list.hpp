#pragma once

#include <cstddef>
#include <memory>
#include <utility>

namespace miniiter {

/**
 * @brief Owning singly-linked list with O(1) prepend, pop and length.
 *
 * Each node owns its payload and the node after it. Ownership of a node
 * moves to the caller of PopFirst(). The list is move-only; a moved-from
 * list is empty.
 *
 * @tparam T payload type
 */
template <typename T>
class SinglyLinkedList {
public:
    struct Node {
        explicit Node(T d) : data(std::move(d)) {}

        T data;
        std::unique_ptr<Node> next;
    };

    SinglyLinkedList() = default;
    SinglyLinkedList(const SinglyLinkedList&) = delete;
    SinglyLinkedList& operator=(const SinglyLinkedList&) = delete;

    SinglyLinkedList(SinglyLinkedList&& other) noexcept
        : first_(std::move(other.first_)), len_(other.len_) {
        other.len_ = 0;
    }

    SinglyLinkedList& operator=(SinglyLinkedList&& other) noexcept {
        if (this != &other) {
            Clear();
            first_ = std::move(other.first_);
            len_ = other.len_;
            other.len_ = 0;
        }
        return *this;
    }

    // Unlinks node by node so long lists do not recurse through ~unique_ptr
    ~SinglyLinkedList() { Clear(); }

    /**
     * @brief Inserts a node at the front of the list.
     *
     * @param node node to link in; a null node is ignored
     */
    void Prepend(std::unique_ptr<Node> node) noexcept {
        if (!node) {
            return;
        }
        node->next = std::move(first_);
        first_ = std::move(node);
        ++len_;
    }

    void PushFront(T data) {
        Prepend(std::make_unique<Node>(std::move(data)));
    }

    /**
     * @brief Detaches the front node and hands it to the caller.
     *
     * @return the former front node, or nullptr if the list is empty
     */
    std::unique_ptr<Node> PopFirst() noexcept {
        if (!first_) {
            return nullptr;
        }
        std::unique_ptr<Node> node = std::move(first_);
        first_ = std::move(node->next);
        --len_;
        return node;
    }

    const Node* First() const noexcept { return first_.get(); }

    size_t Len() const noexcept { return len_; }
    bool Empty() const noexcept { return len_ == 0; }

    void Clear() noexcept {
        while (first_) {
            first_ = std::move(first_->next);
        }
        len_ = 0;
    }

private:
    std::unique_ptr<Node> first_;
    size_t len_ = 0;
};

} // namespace miniiter
