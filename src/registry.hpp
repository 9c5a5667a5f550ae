#pragma once

#include "controller_interface.hpp"
#include "log.hpp"

#include <stdexcept>
#include <vector>

namespace tickback
{
    // Scene-wide set of active controllers.
    //
    // The registry is owned by the session and only touched from the tick driver's
    // thread. It does not own controllers: add() / remove() are paired with the entity's
    // lifetime, usually through a ControllerRegistration.
    class ControllerRegistry
    {
    public:
        ControllerRegistry() = default;
        ControllerRegistry(const ControllerRegistry &) = delete;
        ControllerRegistry &operator=(const ControllerRegistry &) = delete;

        void add(IController &controller)
        {
            if (find(controller.entity()) != nullptr)
            {
                throw std::runtime_error("ControllerRegistry::add: duplicate EntityId");
            }
            m_controllers.push_back(&controller);
            ++m_generation;
        }

        // Returns false if the controller was not registered.
        bool remove(IController &controller) noexcept
        {
            for (auto it = m_controllers.begin(); it != m_controllers.end(); ++it)
            {
                if (*it == &controller)
                {
                    m_controllers.erase(it);
                    ++m_generation;
                    return true;
                }
            }
            return false;
        }

        std::size_t size() const noexcept { return m_controllers.size(); }
        bool empty() const noexcept { return m_controllers.empty(); }

        IController *find(EntityId entity) const noexcept
        {
            for (IController *c : m_controllers)
            {
                if (c->entity() == entity)
                {
                    return c;
                }
            }
            return nullptr;
        }

        // Broadcasts rollback_to(tick). Returns how many controllers had a state for `tick`.
        std::size_t rollback_all(Tick tick)
        {
            std::size_t count = 0;
            broadcast_([tick, &count](IController &c)
                       {
                           if (c.rollback_to(tick))
                           {
                               ++count;
                           } });
            return count;
        }

        // Broadcasts reset_state(). Returns how many controllers were reset.
        std::size_t reset_all()
        {
            std::size_t count = 0;
            broadcast_([&count](IController &c)
                       {
                           if (c.reset_state())
                           {
                               ++count;
                           } });
            return count;
        }

        // Routes a message to the controller for msg.entity.
        bool deliver(const WireMessage &msg)
        {
            IController *c = find(msg.entity);
            if (!c)
            {
                Logger::instance().logf(LogLevel::Debug, msg.dst, msg.entity, 0,
                                        "no controller registered for message from peer %u",
                                        static_cast<unsigned>(msg.src));
                return false;
            }
            return c->receive(msg);
        }

        template <class Fn>
        void for_each(Fn &&fn)
        {
            broadcast_(fn);
        }

    private:
        // Visits the controllers registered when the broadcast starts. Controllers added
        // by a callback wait for the next broadcast; controllers removed by a callback
        // (and possibly destroyed) are skipped.
        template <class Fn>
        void broadcast_(Fn &&fn)
        {
            const std::vector<IController *> snapshot = m_controllers;
            const std::uint64_t generation = m_generation;
            for (IController *c : snapshot)
            {
                if (m_generation != generation && !registered_(c))
                {
                    continue;
                }
                fn(*c);
            }
        }

        bool registered_(const IController *controller) const noexcept
        {
            for (const IController *c : m_controllers)
            {
                if (c == controller)
                {
                    return true;
                }
            }
            return false;
        }

        std::vector<IController *> m_controllers;
        std::uint64_t m_generation = 0;
    };

    // Registers a controller for the lifetime of this object.
    class ControllerRegistration
    {
    public:
        ControllerRegistration(ControllerRegistry &registry, IController &controller)
            : m_registry(&registry), m_controller(&controller)
        {
            m_registry->add(*m_controller);
        }

        ~ControllerRegistration() { reset(); }

        ControllerRegistration(const ControllerRegistration &) = delete;
        ControllerRegistration &operator=(const ControllerRegistration &) = delete;

        ControllerRegistration(ControllerRegistration &&other) noexcept
            : m_registry(other.m_registry), m_controller(other.m_controller)
        {
            other.m_registry = nullptr;
            other.m_controller = nullptr;
        }

        ControllerRegistration &operator=(ControllerRegistration &&other) noexcept
        {
            if (this != &other)
            {
                reset();
                m_registry = other.m_registry;
                m_controller = other.m_controller;
                other.m_registry = nullptr;
                other.m_controller = nullptr;
            }
            return *this;
        }

        void reset() noexcept
        {
            // Already removed by hand is fine.
            if (m_registry && m_controller && !m_registry->remove(*m_controller))
            {
                Logger::instance().logf(LogLevel::Debug, 0, 0, 0,
                                        "registration released for a controller that was already removed");
            }
            m_registry = nullptr;
            m_controller = nullptr;
        }

    private:
        ControllerRegistry *m_registry = nullptr;
        IController *m_controller = nullptr;
    };
}
