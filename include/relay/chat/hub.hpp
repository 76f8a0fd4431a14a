#ifndef RELAY_CHAT_HUB_HPP
#define RELAY_CHAT_HUB_HPP

/**
 * @file hub.hpp
 * @brief Single coordination point of the relay.
 *
 * Responsibilities:
 *  - Own the membership set and the message store.
 *  - Serialize every state transition on one strand, in arrival order.
 *  - Fan events out to every member's outbound queue without ever blocking;
 *    a member whose queue is full is evicted at the end of the pass.
 *
 * The public entry points (register_client, unregister_client, broadcast,
 * dispatch) are thread-safe: they only post work to the strand. The
 * synchronous operations (add_message, edit_message, delete_message and
 * store()) must run on the hub's executor, or while no hub event is running;
 * debug builds assert this. member_count() is safe from any thread.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <relay/chat/client.hpp>
#include <relay/chat/MessageStore.hpp>
#include <relay/chat/Metrics.hpp>
#include <relay/chat/protocol.hpp>

namespace relay::chat
{
    namespace net = boost::asio;

    class Hub
    {
    public:
        using ClientPtr = std::shared_ptr<Client>;

        Hub(net::any_io_executor executor,
            std::unique_ptr<IMessageStore> store,
            std::size_t historyLimit,
            ChatMetrics &metrics);

        Hub(const Hub &) = delete;
        Hub &operator=(const Hub &) = delete;

        /// Admit, replay recent history to it, announce presence to all.
        void register_client(ClientPtr client);

        /// Remove, close its queue, announce presence. No-op when absent.
        void unregister_client(ClientPtr client);

        /// Non-blocking fan-out to every member.
        void broadcast(std::string frame);

        /// Apply one decoded command on behalf of @p from.
        void dispatch(ClientPtr from, Command command);

        // ---- Serialized operations (hub executor only) --------------------

        void add_message(const ChatMessage &msg);
        bool edit_message(const std::string &id, const std::string &requesterId, const std::string &content);
        bool delete_message(const std::string &id, const std::string &requesterId);

        [[nodiscard]] const IMessageStore &store() const;

        [[nodiscard]] std::size_t member_count() const noexcept { return memberCount_.load(); }

    private:
        /// Runs @p fn on the strand as one hub event.
        template <typename Fn>
        void post_event(Fn fn);

        /// Debug check that no other thread is inside a hub event.
        void check_event_thread() const;

        bool is_member(const ClientPtr &client) const;
        void set_members_changed();

        void do_register(const ClientPtr &client);
        void do_unregister(const ClientPtr &client);
        void do_broadcast(const std::string &frame);
        void do_dispatch(const ClientPtr &from, const Command &command);

        /// One pass over the members; returns those whose queue was full.
        std::vector<ClientPtr> fan_out(const std::string &frame);

        /// Drop members from the set and close their queues.
        void evict(const std::vector<ClientPtr> &clients);

        void replay_history(const ClientPtr &client);
        void announce_presence();
        std::string presence_frame() const;

        net::strand<net::any_io_executor> strand_;
        std::unique_ptr<IMessageStore> store_;
        std::size_t historyLimit_;
        ChatMetrics &metrics_;

        /// Registration order; presence snapshots list members in it.
        std::vector<ClientPtr> members_;
        std::atomic<std::size_t> memberCount_{0};

        /// Thread running the current hub event, or none.
        std::atomic<std::thread::id> eventThread_{};
    };

} // namespace relay::chat

#endif // RELAY_CHAT_HUB_HPP
