#include "label_generator.hh"

#include "exception.hh"
#include "format.hh"
#include "string_utils.hh"
#include "unit_tests.hh"

#include <algorithm>

namespace Bibsync
{

String TemplateLabelGenerator::apply_template(StringView content) const
{
    return replace(m_params.label_template, "$", content);
}

String TemplateLabelGenerator::get_label(int position) const
{
    if (position <= 0)
        return {};
    return apply_template(render(position));
}

String TemplateLabelGenerator::get_label(ConstArrayView<int> positions) const
{
    String content;
    auto append = [&](StringView item) {
        if (not content.empty())
            content += m_params.separator;
        content += item;
    };

    for (size_t i = 0; i < positions.size();)
    {
        if (positions[i] <= 0)
        {
            ++i;
            continue;
        }

        size_t run_end = i + 1;
        if (m_params.compress_ranges)
        {
            while (run_end < positions.size() and
                   positions[run_end] == positions[run_end-1] + 1)
                ++run_end;
        }

        if (run_end - i >= 3)
        {
            append(format("{}-{}", render(positions[i]), render(positions[run_end-1])));
            i = run_end;
        }
        else
            append(render(positions[i++]));
    }

    if (content.empty())
        return {};
    return apply_template(content);
}

String NumberedLabelGenerator::render(int position) const
{
    return to_string(position);
}

String AlphabeticLabelGenerator::render(int position) const
{
    String res;
    for (; position > 0; position = (position - 1) / 26)
        res.push_back((char)('a' + (position - 1) % 26));
    std::reverse(res.begin(), res.end());
    return res;
}

template<typename Generator>
static std::unique_ptr<LabelGenerator> create_generator(const LabelGeneratorParameters& params)
{
    return std::make_unique<Generator>(params);
}

LabelGeneratorRegistry::LabelGeneratorRegistry()
{
    register_generator("numbered", {
        create_generator<NumberedLabelGenerator>,
        "positions as decimal numbers: 1, 2, 3" });
    register_generator("alphabetic", {
        create_generator<AlphabeticLabelGenerator>,
        "positions as lowercase letters: a, b, ..., z, aa" });
}

void LabelGeneratorRegistry::register_generator(String name, LabelGeneratorFactoryAndDocstring desc)
{
    if (m_generators.contains(name))
        throw runtime_error(format("label generator '{}' already registered", name));
    m_generators.emplace(std::move(name), desc);
}

bool LabelGeneratorRegistry::has_generator(StringView name) const
{
    return m_generators.contains(name.str());
}

std::unique_ptr<LabelGenerator> LabelGeneratorRegistry::create(StringView name,
                                                               const LabelGeneratorParameters& params) const
{
    auto it = m_generators.find(name.str());
    if (it == m_generators.end())
        throw runtime_error(format("no such label generator: '{}'", name));
    return it->second.factory(params);
}

UnitTest test_numbered_labels{[]{
    NumberedLabelGenerator plain{LabelGeneratorParameters{}};
    bib_assert(plain.get_label(3) == "3");
    bib_assert(plain.get_label(0) == "");
    bib_assert(plain.get_label({2, 3}) == "2,3");
    bib_assert(plain.get_label({1, 2, 3, 5}) == "1,2,3,5");
    bib_assert(plain.get_label({2, 2}) == "2,2");
    bib_assert(plain.get_label(ConstArrayView<int>{}) == "");

    NumberedLabelGenerator bracketed{LabelGeneratorParameters{"[$]", ", ", true}};
    bib_assert(bracketed.get_label(4) == "[4]");
    bib_assert(bracketed.get_label({1, 2, 3, 5}) == "[1-3, 5]");
    bib_assert(bracketed.get_label({3, 1, 2}) == "[3, 1, 2]");
    bib_assert(bracketed.get_label({7, 8}) == "[7, 8]");
    bib_assert(bracketed.get_label({4, 5, 6, 7, 9, 10, 11}) == "[4-7, 9-11]");
    bib_assert(bracketed.get_label(ConstArrayView<int>{}) == "");
}};

UnitTest test_alphabetic_labels{[]{
    AlphabeticLabelGenerator generator{LabelGeneratorParameters{"($)", ";", false}};
    bib_assert(generator.get_label(1) == "(a)");
    bib_assert(generator.get_label(26) == "(z)");
    bib_assert(generator.get_label(27) == "(aa)");
    bib_assert(generator.get_label(28) == "(ab)");
    bib_assert(generator.get_label(702) == "(zz)");
    bib_assert(generator.get_label(703) == "(aaa)");
    bib_assert(generator.get_label({2, 1}) == "(b;a)");
}};

UnitTest test_label_generator_registry{[]{
    LabelGeneratorRegistry registry;
    bib_assert(registry.has_generator("numbered") and registry.has_generator("alphabetic"));

    auto numbered = registry.create("numbered", {"[$]"});
    bib_assert(numbered->get_label({1, 4}) == "[1,4]");
    auto alphabetic = registry.create("alphabetic", {});
    bib_assert(alphabetic->get_label(3) == "c");

    bib_expect_throw(runtime_error, registry.create("roman", {}));
    bib_expect_throw(runtime_error, registry.register_generator("numbered", {create_generator<NumberedLabelGenerator>, ""}));
}};

}
