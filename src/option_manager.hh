#ifndef option_manager_hh_INCLUDED
#define option_manager_hh_INCLUDED

#include "exception.hh"
#include "option_types.hh"
#include "unordered_map.hh"
#include "utils.hh"
#include "vector.hh"

#include <memory>

namespace Bibsync
{

class OptionManager;

class OptionDesc
{
public:
    OptionDesc(String name, String docstring);

    const String& name() const { return m_name; }
    const String& docstring() const { return m_docstring; }

private:
    String m_name;
    String m_docstring;
};

class Option : public UseMemoryDomain<MemoryDomain::Options>
{
public:
    virtual ~Option() = default;

    template<typename T> const T& get() const;
    template<typename T> void set(const T& val, bool notify=true);
    template<typename T> bool is_of_type() const;

    virtual String get_as_string() const = 0;
    virtual void set_from_string(StringView str) = 0;

    OptionManager& manager() const { return m_manager; }

    const String& name() const { return m_desc.name(); }
    const String& docstring() const { return m_desc.docstring(); }

protected:
    Option(const OptionDesc& desc, OptionManager& manager);

    OptionManager& m_manager;
    const OptionDesc& m_desc;
};

class OptionManagerWatcher
{
public:
    virtual void on_option_changed(const Option& option) = 0;

protected:
    ~OptionManagerWatcher() = default;
};

// Holds the configuration of a session, options are declared
// through an OptionsRegistry then read with options["name"].get<T>()
class OptionManager final
{
public:
    OptionManager() = default;
    ~OptionManager();
    OptionManager(const OptionManager&) = delete;
    OptionManager& operator=(const OptionManager&) = delete;

    Option& operator[] (StringView name);
    const Option& operator[] (StringView name) const;

    bool has_option(StringView name) const;

    void register_watcher(OptionManagerWatcher& watcher) const;
    void unregister_watcher(OptionManagerWatcher& watcher) const;

    void on_option_changed(const Option& option);

private:
    friend class OptionsRegistry;
    using OptionMap = UnorderedMap<String, std::unique_ptr<Option>, MemoryDomain::Options>;

    OptionMap m_options;
    mutable Vector<OptionManagerWatcher*, MemoryDomain::Options> m_watchers;
};

template<typename T>
class TypedOption : public Option
{
public:
    TypedOption(OptionManager& manager, const OptionDesc& desc, const T& value)
        : Option(desc, manager), m_value(value) {}

    void set(T value, bool notify = true)
    {
        if (m_value != value)
        {
            m_value = std::move(value);
            if (notify)
                manager().on_option_changed(*this);
        }
    }
    const T& get() const { return m_value; }

    String get_as_string() const override
    {
        return option_to_string(m_value);
    }

    void set_from_string(StringView str) override
    {
        set(option_from_string(Meta::Type<T>{}, str));
    }

private:
    T m_value;
};

template<typename T> const T& Option::get() const
{
    auto* typed_opt = dynamic_cast<const TypedOption<T>*>(this);
    if (not typed_opt)
        throw runtime_error(format("option '{}' is not of type '{}'", name(),
                                   option_type_name(Meta::Type<T>{})));
    return typed_opt->get();
}

template<typename T> void Option::set(const T& val, bool notify)
{
    auto* typed_opt = dynamic_cast<TypedOption<T>*>(this);
    if (not typed_opt)
        throw runtime_error(format("option '{}' is not of type '{}'", name(),
                                   option_type_name(Meta::Type<T>{})));
    return typed_opt->set(val, notify);
}

template<typename T> bool Option::is_of_type() const
{
    return dynamic_cast<const TypedOption<T>*>(this) != nullptr;
}

class OptionsRegistry
{
public:
    OptionsRegistry(OptionManager& global_manager) : m_global_manager(global_manager) {}

    template<typename T>
    Option& declare_option(StringView name, StringView docstring, const T& value)
    {
        auto is_option_identifier = [](char c) {
            return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or
                   (c >= '0' and c <= '9') or c == '_';
        };

        if (name.empty() or not all_of(name, is_option_identifier))
            throw runtime_error{format("name '{}' contains char out of [a-zA-Z0-9_]", name)};

        auto& opts = m_global_manager.m_options;
        auto it = opts.find(name.str());
        if (it != opts.end())
        {
            if (it->second->is_of_type<T>())
                return *it->second;
            throw runtime_error{format("option '{}' already declared with different type", name)};
        }
        String doc =  docstring.empty() ? format("[{}]", option_type_name(Meta::Type<T>{}))
                                        : format("[{}] - {}", option_type_name(Meta::Type<T>{}), docstring);
        m_descs.emplace_back(new OptionDesc{name.str(), std::move(doc)});
        auto& option = opts[m_descs.back()->name()];
        option = std::make_unique<TypedOption<T>>(m_global_manager, *m_descs.back(), value);
        return *option;
    }

    const OptionDesc* option_desc(StringView name) const;
    bool option_exists(StringView name) const { return option_desc(name) != nullptr; }

private:
    OptionManager& m_global_manager;
    Vector<std::unique_ptr<const OptionDesc>, MemoryDomain::Options> m_descs;
};

}

#endif // option_manager_hh_INCLUDED
