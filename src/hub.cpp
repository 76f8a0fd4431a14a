#include <relay/chat/hub.hpp>

#include <algorithm>
#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace relay::chat
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        template <typename>
        inline constexpr bool always_false_v = false;

        class EventScope
        {
        public:
            explicit EventScope(std::atomic<std::thread::id> &slot) noexcept
                : slot_(slot)
            {
                slot_.store(std::this_thread::get_id());
            }

            ~EventScope() { slot_.store(std::thread::id{}); }

            EventScope(const EventScope &) = delete;
            EventScope &operator=(const EventScope &) = delete;

        private:
            std::atomic<std::thread::id> &slot_;
        };
    }

    Hub::Hub(net::any_io_executor executor,
             std::unique_ptr<IMessageStore> store,
             std::size_t historyLimit,
             ChatMetrics &metrics)
        : strand_(net::make_strand(std::move(executor))),
          store_(std::move(store)),
          historyLimit_(historyLimit),
          metrics_(metrics),
          members_()
    {
    }

    // ───────────────────────── Event entry points ─────────────────────────

    template <typename Fn>
    void Hub::post_event(Fn fn)
    {
        net::post(strand_,
                  [this, fn = std::move(fn)]() mutable
                  {
                      EventScope scope{eventThread_};
                      fn();
                  });
    }

    void Hub::register_client(ClientPtr client)
    {
        post_event([this, client = std::move(client)]()
                   { do_register(client); });
    }

    void Hub::unregister_client(ClientPtr client)
    {
        post_event([this, client = std::move(client)]()
                   { do_unregister(client); });
    }

    void Hub::broadcast(std::string frame)
    {
        post_event([this, frame = std::move(frame)]()
                   { do_broadcast(frame); });
    }

    void Hub::dispatch(ClientPtr from, Command command)
    {
        post_event([this, from = std::move(from), command = std::move(command)]()
                   { do_dispatch(from, command); });
    }

    void Hub::check_event_thread() const
    {
        [[maybe_unused]] const auto owner = eventThread_.load();
        assert((owner == std::thread::id{} || owner == std::this_thread::get_id()) &&
               "hub state used off its executor while an event is running");
    }

    const IMessageStore &Hub::store() const
    {
        check_event_thread();
        return *store_;
    }

    // ───────────────────────── Membership ─────────────────────────

    bool Hub::is_member(const ClientPtr &client) const
    {
        return std::find(members_.begin(), members_.end(), client) != members_.end();
    }

    void Hub::set_members_changed()
    {
        memberCount_.store(members_.size());
        metrics_.connections_active.store(members_.size());
    }

    void Hub::do_register(const ClientPtr &client)
    {
        if (!client || is_member(client))
            return;

        members_.push_back(client);
        set_members_changed();

        logger.log(Logger::Level::INFO,
                   "[Chat][Hub] Client {} ({}) connected. Total clients: {}",
                   client->username(), client->id(), members_.size());

        try
        {
            replay_history(client);

            // The queue buffers until the writer drains it, so the snapshot
            // can follow the replay directly.
            announce_presence();
        }
        catch (const std::exception &e)
        {
            metrics_.errors_total.fetch_add(1);
            logger.log(Logger::Level::ERROR,
                       "[Chat][Hub] Registering {} failed: {}", client->id(), e.what());
        }
    }

    void Hub::do_unregister(const ClientPtr &client)
    {
        auto it = std::find(members_.begin(), members_.end(), client);
        if (it == members_.end())
            return;

        members_.erase(it);
        client->queue().close();
        set_members_changed();

        logger.log(Logger::Level::INFO,
                   "[Chat][Hub] Client {} ({}) disconnected. Total clients: {}",
                   client->username(), client->id(), members_.size());

        try
        {
            announce_presence();
        }
        catch (const std::exception &e)
        {
            metrics_.errors_total.fetch_add(1);
            logger.log(Logger::Level::ERROR,
                       "[Chat][Hub] Presence update after {} left failed: {}", client->id(), e.what());
        }
    }

    void Hub::evict(const std::vector<ClientPtr> &clients)
    {
        for (const auto &client : clients)
        {
            auto it = std::find(members_.begin(), members_.end(), client);
            if (it == members_.end())
                continue;

            members_.erase(it);
            client->queue().close();
            metrics_.evictions_total.fetch_add(1);

            logger.log(Logger::Level::WARN,
                       "[Chat][Hub] Evicted {} ({}): outbound queue full",
                       client->username(), client->id());
        }

        set_members_changed();
    }

    // ───────────────────────── Fan-out ─────────────────────────

    std::vector<Hub::ClientPtr> Hub::fan_out(const std::string &frame)
    {
        std::vector<ClientPtr> saturated;

        for (const auto &client : members_)
        {
            switch (client->queue().try_push(frame))
            {
            case OutboundQueue::PushResult::Queued:
                metrics_.frames_out_total.fetch_add(1);
                break;
            case OutboundQueue::PushResult::Full:
            case OutboundQueue::PushResult::Closed:
                saturated.push_back(client);
                break;
            }
        }

        logger.log(Logger::Level::DEBUG,
                   "[Chat][Hub] Broadcast to {}/{} clients",
                   members_.size() - saturated.size(), members_.size());

        return saturated;
    }

    void Hub::do_broadcast(const std::string &frame)
    {
        auto saturated = fan_out(frame);

        // Evictions change the presence list; each round can only shrink
        // the membership, so this terminates.
        while (!saturated.empty())
        {
            evict(saturated);
            if (members_.empty())
                break;
            saturated = fan_out(presence_frame());
        }
    }

    void Hub::replay_history(const ClientPtr &client)
    {
        std::vector<ChatMessage> history;
        try
        {
            history = store_->recent(historyLimit_);
        }
        catch (const std::exception &e)
        {
            metrics_.errors_total.fetch_add(1);
            logger.log(Logger::Level::ERROR,
                       "[Chat][Hub] Failed to load history for {}: {}",
                       client->username(), e.what());
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[Chat][Hub] Sending {} recent messages to {}",
                   history.size(), client->username());

        for (const auto &msg : history)
        {
            if (client->queue().try_push(serialize_message(msg)) != OutboundQueue::PushResult::Queued)
            {
                logger.log(Logger::Level::WARN,
                           "[Chat][Hub] History replay to {} stopped: queue full",
                           client->username());
                return;
            }
            metrics_.frames_out_total.fetch_add(1);
        }
    }

    std::string Hub::presence_frame() const
    {
        std::vector<Presence> users;
        users.reserve(members_.size());
        for (const auto &client : members_)
            users.push_back(client->presence());

        return serialize_user_list(users, Clock::now());
    }

    void Hub::announce_presence()
    {
        if (members_.empty())
            return;

        do_broadcast(presence_frame());
    }

    // ───────────────────────── Store operations ─────────────────────────

    void Hub::add_message(const ChatMessage &msg)
    {
        check_event_thread();
        store_->append(msg);
        logger.log(Logger::Level::DEBUG,
                   "[Chat][Hub] Message stored. Total messages: {}", store_->size());
    }

    bool Hub::edit_message(const std::string &id,
                           const std::string &requesterId,
                           const std::string &content)
    {
        check_event_thread();
        if (!store_->edit(id, requesterId, content))
        {
            logger.log(Logger::Level::DEBUG,
                       "[Chat][Hub] Message {} not found for editing by {}", id, requesterId);
            return false;
        }
        return true;
    }

    bool Hub::delete_message(const std::string &id, const std::string &requesterId)
    {
        check_event_thread();
        if (!store_->remove(id, requesterId))
        {
            logger.log(Logger::Level::DEBUG,
                       "[Chat][Hub] Message {} not found for deletion by {}", id, requesterId);
            return false;
        }
        return true;
    }

    // ───────────────────────── Commands ─────────────────────────

    void Hub::do_dispatch(const ClientPtr &from, const Command &command)
    {
        if (!from || !is_member(from))
        {
            logger.log(Logger::Level::DEBUG,
                       "[Chat][Hub] Dropping '{}' from a client that is no longer registered",
                       command_name(command));
            return;
        }

        const TimePoint now = Clock::now();
        from->touch(now);

        try
        {
            std::visit(
                [&](const auto &cmd)
                {
                    using T = std::decay_t<decltype(cmd)>;

                    if constexpr (std::is_same_v<T, SendMessage>)
                    {
                        ChatMessage msg{make_uuid(), from->username(), from->id(), cmd.content, now, false};
                        add_message(msg);
                        do_broadcast(serialize_message(msg));
                    }
                    else if constexpr (std::is_same_v<T, SetTyping>)
                    {
                        from->set_typing(cmd.isTyping);
                        announce_presence();
                    }
                    else if constexpr (std::is_same_v<T, EditMessage>)
                    {
                        if (edit_message(cmd.messageId, from->id(), cmd.content))
                            do_broadcast(serialize_message_edited(cmd.messageId, cmd.content, now));
                    }
                    else if constexpr (std::is_same_v<T, DeleteMessage>)
                    {
                        if (delete_message(cmd.messageId, from->id()))
                            do_broadcast(serialize_message_deleted(cmd.messageId, now));
                    }
                    else
                    {
                        static_assert(always_false_v<T>, "unhandled command");
                    }
                },
                command);
        }
        catch (const std::exception &e)
        {
            metrics_.errors_total.fetch_add(1);
            logger.log(Logger::Level::ERROR,
                       "[Chat][Hub] '{}' from {} failed: {}",
                       command_name(command), from->username(), e.what());
        }
    }

} // namespace relay::chat
