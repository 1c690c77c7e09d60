#pragma once

// =============================================================================
// Environment — Kuzur's variable scope
// =============================================================================
//
// An Environment is one frame: a string→KObject map plus a shared pointer to
// the enclosing frame. Frames are created for the global scope and for every
// function call; if/while/for/do bodies run in the frame that contains them.
// Global and call frames are *call boundaries*.
//
// Lookup:
//   lookup() — walks the whole chain outward, throws NameError on miss.
//
// Assignment:
//   assign() — walks outward but stops at the first call boundary; updates
//              the binding if found there, otherwise creates it in the current
//              frame. A function therefore never rebinds its caller's or the
//              global scope's names: `x = 5` inside a call shadows a global x.
//
// Local declaration:
//   define() — always creates/overwrites in the current frame (parameters,
//              function declarations).
//
// Frames are shared because closures keep their defining frame alive.
// =============================================================================

#include "kobject.hpp"
#include "../lib/errors/error.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace kuzur
{

    class Environment
    {
    public:
        /// Construct the global scope (no parent, call boundary)
        Environment() : parent_(nullptr), callBoundary_(true) {}

        /// Construct a child scope
        explicit Environment(std::shared_ptr<Environment> parent, bool callBoundary = false)
            : parent_(std::move(parent)), callBoundary_(callBoundary) {}

        /// Look up a variable, walking up the scope chain.
        /// Throws NameError if not found anywhere.
        KObject lookup(const std::string &name, int line, int column = 0) const
        {
            const Environment *env = this;
            while (env)
            {
                auto it = env->vars_.find(name);
                if (it != env->vars_.end())
                    return it->second;
                env = env->parent_.get();
            }
            throw NameError(name, line, column);
        }

        /// Rebind within the current call, or create in the current frame.
        void assign(const std::string &name, KObject value)
        {
            Environment *env = this;
            while (env)
            {
                auto it = env->vars_.find(name);
                if (it != env->vars_.end())
                {
                    it->second = std::move(value);
                    return;
                }
                if (env->callBoundary_)
                    break;
                env = env->parent_.get();
            }
            vars_[name] = std::move(value);
        }

        /// Force-define in the current frame
        void define(const std::string &name, KObject value)
        {
            vars_[name] = std::move(value);
        }

        /// Check whether a variable exists anywhere in the chain
        bool has(const std::string &name) const
        {
            const Environment *env = this;
            while (env)
            {
                if (env->vars_.count(name))
                    return true;
                env = env->parent_.get();
            }
            return false;
        }

        /// Check the current frame only
        bool hasLocal(const std::string &name) const { return vars_.count(name) != 0; }

        bool isCallBoundary() const { return callBoundary_; }

        const std::shared_ptr<Environment> &parent() const { return parent_; }

        size_t size() const { return vars_.size(); }

        /// Drop every binding. Breaks closure reference cycles when a frame is
        /// retired (a function value stored in the frame it captured).
        void clear() { vars_.clear(); }

        /// True when, apart from the handle passed in, the only owners of
        /// `frame` are functions declared in it that nothing outside the
        /// frame holds. Such a frame can be cleared once its call returns.
        static bool heldOnlyByOwnClosures(const std::shared_ptr<Environment> &frame)
        {
            // function payload -> number of bindings in this frame
            std::unordered_map<const KFunction *, uint32_t> closures;
            for (const auto &entry : frame->vars_)
            {
                const KObject &value = entry.second;
                if (value.isFunction() && value.asFunction().closureEnv == frame)
                    closures[&value.asFunction()]++;
            }

            for (const auto &entry : frame->vars_)
            {
                const KObject &value = entry.second;
                if (!value.isFunction() || value.asFunction().closureEnv != frame)
                    continue;
                if (value.refCount() != closures[&value.asFunction()])
                    return false; // escaped: returned, or held by a caller
            }
            return frame.use_count() == 1 + static_cast<long>(closures.size());
        }

    private:
        std::unordered_map<std::string, KObject> vars_;
        std::shared_ptr<Environment> parent_;
        bool callBoundary_;
    };

} // namespace kuzur
