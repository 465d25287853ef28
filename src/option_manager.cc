#include "option_manager.hh"

#include "debug.hh"
#include "unit_tests.hh"

namespace Bibsync
{

OptionDesc::OptionDesc(String name, String docstring)
    : m_name(std::move(name)), m_docstring(std::move(docstring)) {}

Option::Option(const OptionDesc& desc, OptionManager& manager)
    : m_manager(manager), m_desc(desc) {}

OptionManager::~OptionManager()
{
    bib_assert(m_watchers.empty());
}

void OptionManager::register_watcher(OptionManagerWatcher& watcher) const
{
    bib_assert(not contains(m_watchers, &watcher));
    m_watchers.push_back(&watcher);
}

void OptionManager::unregister_watcher(OptionManagerWatcher& watcher) const
{
    auto it = find(m_watchers, &watcher);
    bib_assert(it != m_watchers.end());
    m_watchers.erase(it);
}

Option& OptionManager::operator[](StringView name)
{
    auto it = m_options.find(name.str());
    if (it == m_options.end())
        throw runtime_error(format("no such option: '{}'", name));
    return *it->second;
}

const Option& OptionManager::operator[](StringView name) const
{
    return const_cast<OptionManager&>(*this)[name];
}

bool OptionManager::has_option(StringView name) const
{
    return m_options.find(name.str()) != m_options.end();
}

void OptionManager::on_option_changed(const Option& option)
{
    // watchers may unregister themselves while being notified
    auto watchers = m_watchers;
    for (auto* watcher : watchers)
    {
        if (contains(m_watchers, watcher))
            watcher->on_option_changed(option);
    }
}

const OptionDesc* OptionsRegistry::option_desc(StringView name) const
{
    auto it = find_if(m_descs,
                      [&name](const std::unique_ptr<const OptionDesc>& opt)
                      { return opt->name() == name; });
    return it != m_descs.end() ? it->get() : nullptr;
}

UnitTest test_options{[]{
    OptionManager options;
    OptionsRegistry registry{options};
    registry.declare_option<String>("citation_kind", "sentinel value", "bibr");
    registry.declare_option<bool>("label_compress_ranges", "", false);
    registry.declare_option<DebugFlags>("debug", "", DebugFlags::None);

    bib_assert(options["citation_kind"].get<String>() == "bibr");
    bib_assert(registry.option_desc("citation_kind")->docstring() == "[str] - sentinel value");
    bib_assert(registry.option_desc("debug")->docstring() == "[flags(classify|recompute|reconcile)]");
    bib_assert(not registry.option_exists("citation_style"));

    struct Watcher : OptionManagerWatcher
    {
        void on_option_changed(const Option& option) override { changed.emplace_back(option.name()); }
        Vector<String> changed;
    } watcher;

    options.register_watcher(watcher);
    options["label_compress_ranges"].set_from_string("yes");
    options["label_compress_ranges"].set(true);
    options["debug"].set_from_string("classify|reconcile");
    options.unregister_watcher(watcher);

    bib_assert(watcher.changed.size() == 2);
    bib_assert(options["label_compress_ranges"].get<bool>());
    bib_assert(options["debug"].get<DebugFlags>() & DebugFlags::Reconcile);
    bib_assert(options["debug"].get_as_string() == "classify|reconcile");

    bib_expect_throw(runtime_error, options["citation_style"]);
    bib_expect_throw(runtime_error, options["citation_kind"].get<bool>());
    bib_expect_throw(runtime_error, options["label_compress_ranges"].set_from_string("maybe"));
    bib_expect_throw(runtime_error, options["debug"].set_from_string("everything"));
    bib_expect_throw(runtime_error, registry.declare_option<bool>("citation_kind", "", false));
    bib_expect_throw(runtime_error, registry.declare_option<bool>("bad-name", "", false));
}};

}
