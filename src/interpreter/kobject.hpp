#pragma once

// =============================================================================
// KObject — Kuzur's runtime value type
// =============================================================================
//
// Design:
//   Every Kuzur value at runtime is a KObject. A KObject is a lightweight
//   handle (single pointer) to a heap-allocated control block (KData) that
//   holds: reference count, type tag, and a void* to the actual payload.
//
//   Copying a KObject is cheap: a pointer copy plus a ref count bump.
//   Destruction decrements the ref count; when it hits zero the payload and
//   control block are freed.
//
//   Payloads are never mutated after construction, so sharing one between
//   several handles is never observable from Kuzur code.
//
// Memory layout:
//
//   KObject  (stack)
//   ┌──────────┐
//   │  data_*  │──→  KData  (heap)
//   └──────────┘     ┌─────────────────────────┐
//                    │ refCount (atomic uint32) │
//                    │ type     (KType)         │
//                    │ payload  (void*)         │──→ actual data
//                    └─────────────────────────┘
//
// =============================================================================

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kuzur
{

    struct Block;
    class Environment;

    // ========================================================================
    // KType — the type tag enum
    // ========================================================================

    enum class KType : uint8_t
    {
        NONE = 0,
        NUMBER, // double
        BOOL,
        STRING,
        FUNCTION,
    };

    /// Human-readable type name for error messages
    const char *ktype_name(KType t);

    // ========================================================================
    // KFunction — a user-defined function closed over its defining scope
    // ========================================================================

    struct KFunction
    {
        std::string name;
        std::vector<std::string> params;
        std::shared_ptr<const Block> body;        // shared with the FuncDecl node
        std::shared_ptr<Environment> closureEnv;  // lexical scope at definition

        KFunction(std::string name, std::vector<std::string> params,
                  std::shared_ptr<const Block> body,
                  std::shared_ptr<Environment> closureEnv)
            : name(std::move(name)), params(std::move(params)),
              body(std::move(body)), closureEnv(std::move(closureEnv)) {}
    };

    // ========================================================================
    // KData — the heap-allocated control block
    // ========================================================================

    struct KData
    {
        std::atomic<uint32_t> refCount;
        KType type;
        void *payload; // points to the type-specific data

        KData(KType type, void *payload)
            : refCount(1), type(type), payload(payload) {}

        // No copy/move — always heap allocated, managed by KObject
        KData(const KData &) = delete;
        KData &operator=(const KData &) = delete;
    };

    // ========================================================================
    // KObject — the value handle
    // ========================================================================

    class KObject
    {
    public:
        // ---- Construction: named factory methods (no implicit conversions) ----

        static KObject makeNone();
        static KObject makeNumber(double value);
        static KObject makeBool(bool value);
        static KObject makeString(const std::string &value);
        static KObject makeString(std::string &&value);

        /// function (closureEnv = lexical scope at definition site)
        static KObject makeFunction(const std::string &name,
                                    const std::vector<std::string> &params,
                                    std::shared_ptr<const Block> body,
                                    std::shared_ptr<Environment> closureEnv);

        // ---- Default constructor → none ----

        KObject();

        // ---- Big Five: ref-counted copy/move ----

        ~KObject();
        KObject(const KObject &other);
        KObject &operator=(const KObject &other);
        KObject(KObject &&other) noexcept;
        KObject &operator=(KObject &&other) noexcept;

        // ---- Type queries ----

        KType type() const;
        bool isNone() const;
        bool isNumber() const;
        bool isBool() const;
        bool isString() const;
        bool isFunction() const;

        // ---- Payload access (unchecked — caller must verify type first) ----

        double asNumber() const;
        bool asBool() const;
        const std::string &asString() const;
        const KFunction &asFunction() const;

        // ---- Conversion to string (for print / str / concatenation) ----

        std::string toString() const;

        // ---- Comparison: different kinds are never equal ----

        bool equals(const KObject &other) const;

        // ---- Debug: ref count (for testing) ----

        uint32_t refCount() const;

        // ---- Debug: global allocation tracking (for leak detection in tests) ----

        static int64_t liveAllocations();

    private:
        KData *data_;

        /// Construct from a pre-built KData (takes ownership, refCount already 1)
        explicit KObject(KData *data);

        void retain();
        void release();

        /// Free the payload based on type
        static void freePayload(KType type, void *payload);
    };

    /// Format a number the way print() shows it: integral values without a
    /// decimal point.
    std::string formatNumber(double value);

} // namespace kuzur
