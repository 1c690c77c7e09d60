#include "kobject.hpp"
#include <cmath>
#include <sstream>

namespace kuzur
{

    // ========================================================================
    // Global allocation counter (debug / test only)
    // ========================================================================

    static std::atomic<int64_t> g_liveAllocs{0};

    int64_t KObject::liveAllocations() { return g_liveAllocs.load(std::memory_order_relaxed); }

    // ========================================================================
    // ktype_name — human-readable type tag
    // ========================================================================

    const char *ktype_name(KType t)
    {
        switch (t)
        {
        case KType::NONE:
            return "none";
        case KType::NUMBER:
            return "number";
        case KType::BOOL:
            return "boolean";
        case KType::STRING:
            return "string";
        case KType::FUNCTION:
            return "function";
        }
        return "unknown";
    }

    // ========================================================================
    // Payload allocation helpers (raw new/delete, tracked)
    // ========================================================================

    static KData *allocData(KType type, void *payload)
    {
        g_liveAllocs.fetch_add(1, std::memory_order_relaxed);
        return new KData(type, payload);
    }

    void KObject::freePayload(KType type, void *payload)
    {
        if (!payload)
            return;

        switch (type)
        {
        case KType::NONE:
            break; // no payload
        case KType::NUMBER:
            delete static_cast<double *>(payload);
            break;
        case KType::BOOL:
            delete static_cast<bool *>(payload);
            break;
        case KType::STRING:
            delete static_cast<std::string *>(payload);
            break;
        case KType::FUNCTION:
            delete static_cast<KFunction *>(payload);
            break;
        }
    }

    // ========================================================================
    // Factory methods
    // ========================================================================

    KObject KObject::makeNone()
    {
        return KObject(allocData(KType::NONE, nullptr));
    }

    KObject KObject::makeNumber(double value)
    {
        return KObject(allocData(KType::NUMBER, new double(value)));
    }

    KObject KObject::makeBool(bool value)
    {
        return KObject(allocData(KType::BOOL, new bool(value)));
    }

    KObject KObject::makeString(const std::string &value)
    {
        return KObject(allocData(KType::STRING, new std::string(value)));
    }

    KObject KObject::makeString(std::string &&value)
    {
        return KObject(allocData(KType::STRING, new std::string(std::move(value))));
    }

    KObject KObject::makeFunction(const std::string &name,
                                  const std::vector<std::string> &params,
                                  std::shared_ptr<const Block> body,
                                  std::shared_ptr<Environment> closureEnv)
    {
        auto *fn = new KFunction(name, params, std::move(body), std::move(closureEnv));
        return KObject(allocData(KType::FUNCTION, fn));
    }

    // ========================================================================
    // Constructors
    // ========================================================================

    KObject::KObject()
        : data_(allocData(KType::NONE, nullptr)) {}

    KObject::KObject(KData *data)
        : data_(data) {}

    // ========================================================================
    // Ref counting
    // ========================================================================

    void KObject::retain()
    {
        if (data_)
            data_->refCount.fetch_add(1, std::memory_order_relaxed);
    }

    void KObject::release()
    {
        if (!data_)
            return;

        if (data_->refCount.fetch_sub(1, std::memory_order_acq_rel) == 1)
        {
            // Old value was 1 → now 0, we own the last reference
            freePayload(data_->type, data_->payload);
            delete data_;
            g_liveAllocs.fetch_sub(1, std::memory_order_relaxed);
        }
        data_ = nullptr;
    }

    // ========================================================================
    // Big Five
    // ========================================================================

    KObject::~KObject()
    {
        release();
    }

    KObject::KObject(const KObject &other)
        : data_(other.data_)
    {
        retain();
    }

    KObject &KObject::operator=(const KObject &other)
    {
        if (this != &other)
        {
            release();
            data_ = other.data_;
            retain();
        }
        return *this;
    }

    KObject::KObject(KObject &&other) noexcept
        : data_(other.data_)
    {
        other.data_ = nullptr;
    }

    KObject &KObject::operator=(KObject &&other) noexcept
    {
        if (this != &other)
        {
            release();
            data_ = other.data_;
            other.data_ = nullptr;
        }
        return *this;
    }

    // ========================================================================
    // Type queries
    // ========================================================================

    KType KObject::type() const { return data_ ? data_->type : KType::NONE; }
    bool KObject::isNone() const { return type() == KType::NONE; }
    bool KObject::isNumber() const { return type() == KType::NUMBER; }
    bool KObject::isBool() const { return type() == KType::BOOL; }
    bool KObject::isString() const { return type() == KType::STRING; }
    bool KObject::isFunction() const { return type() == KType::FUNCTION; }

    // ========================================================================
    // Payload access
    // ========================================================================

    double KObject::asNumber() const { return *static_cast<double *>(data_->payload); }
    bool KObject::asBool() const { return *static_cast<bool *>(data_->payload); }
    const std::string &KObject::asString() const { return *static_cast<std::string *>(data_->payload); }
    const KFunction &KObject::asFunction() const { return *static_cast<KFunction *>(data_->payload); }

    uint32_t KObject::refCount() const
    {
        return data_ ? data_->refCount.load(std::memory_order_relaxed) : 0;
    }

    // ========================================================================
    // toString — string representation for print / str / concatenation
    // ========================================================================

    std::string formatNumber(double val)
    {
        // Print integers without decimal point
        if (val == std::floor(val) && std::isfinite(val) && std::fabs(val) < 1e15)
        {
            long long intVal = static_cast<long long>(val);
            return std::to_string(intVal);
        }
        std::ostringstream oss;
        oss << val;
        return oss.str();
    }

    std::string KObject::toString() const
    {
        switch (type())
        {
        case KType::NONE:
            return "none";
        case KType::NUMBER:
            return formatNumber(asNumber());
        case KType::BOOL:
            return asBool() ? "true" : "false";
        case KType::STRING:
            return asString();
        case KType::FUNCTION:
            return "<func " + asFunction().name + ">";
        }
        return "";
    }

    // ========================================================================
    // equals — structural for scalars, identity for functions
    // ========================================================================

    bool KObject::equals(const KObject &other) const
    {
        if (type() != other.type())
            return false;

        switch (type())
        {
        case KType::NONE:
            return true;
        case KType::NUMBER:
            return asNumber() == other.asNumber();
        case KType::BOOL:
            return asBool() == other.asBool();
        case KType::STRING:
            return asString() == other.asString();
        case KType::FUNCTION:
            return data_->payload == other.data_->payload;
        }
        return false;
    }

} // namespace kuzur
