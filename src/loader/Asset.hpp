// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef Asset_hpp
#define Asset_hpp

#include <memory>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace gload
{
    /// Type-erased, shared, immutable object produced by a load or materialize
    /// primitive. Copies share the same object. An empty Asset means "absent".
    class Asset
    {
    public:
        Asset() = default;

        template<class T>
        static Asset make(T value)
        {
            return wrap<T>(std::make_shared<const T>(std::move(value)));
        }

        template<class T>
        static Asset wrap(std::shared_ptr<const T> ptr)
        {
            Asset a;
            if (ptr)
            {
                a.type_ = typeid(T);
                a.ptr_ = std::move(ptr);
            }
            return a;
        }

        /// Typed access, nullptr if empty or of another type
        template<class T>
        std::shared_ptr<const T> get() const
        {
            if (!is<T>()) return nullptr;
            return std::static_pointer_cast<const T>(ptr_);
        }

        template<class T>
        bool is() const
        {
            return ptr_ && type_ == std::type_index(typeid(T));
        }

        bool has_value() const { return ptr_ != nullptr; }
        explicit operator bool() const { return has_value(); }

        std::type_index type() const { return type_; }

        /// Address of the shared object, for identity checks
        const void* address() const { return ptr_.get(); }

        long use_count() const { return ptr_.use_count(); }

        bool operator==(const Asset& other) const { return ptr_ == other.ptr_; }
        bool operator!=(const Asset& other) const { return ptr_ != other.ptr_; }

    private:
        std::shared_ptr<const void> ptr_;
        std::type_index type_ = typeid(void);
    };

} // namespace gload

#endif // Asset_hpp
