#include "boswell/exceptions.hpp"
#include "boswell/tools/arguments.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace boswell;
using namespace boswell::tools;

static std::string missing_message(ToolId id, const Json& args)
{
    try
    {
        parse_arguments(id, args);
    }
    catch (const ValidationError& e)
    {
        return e.what();
    }
    return "";
}

int main()
{
    // Brief: branch defaults when absent or null
    {
        auto a = std::get<BriefArgs>(parse_arguments(ToolId::Brief, Json::object()));
        assert(a.branch == "command-center");
        auto b = std::get<BriefArgs>(parse_arguments(ToolId::Brief, Json{{"branch", nullptr}}));
        assert(b.branch == "command-center");
        auto c = std::get<BriefArgs>(parse_arguments(ToolId::Brief, Json{{"branch", "iris"}}));
        assert(c.branch == "iris");
    }

    // null arguments behave like {}
    {
        auto a = std::get<BriefArgs>(parse_arguments(ToolId::Brief, Json()));
        assert(a.branch == "command-center");
        assert(std::holds_alternative<GraphArgs>(parse_arguments(ToolId::Graph, Json())));
    }

    // Non-object arguments are rejected
    assert(missing_message(ToolId::Graph, Json::array({1, 2})) ==
           "Invalid arguments: expected an object");
    assert(missing_message(ToolId::Head, Json("branch")) ==
           "Invalid arguments: expected an object");

    // Missing required keys name the field
    assert(missing_message(ToolId::Head, Json::object()) == "Missing required argument: branch");
    assert(missing_message(ToolId::Head, Json{{"branch", nullptr}}) ==
           "Missing required argument: branch");
    assert(missing_message(ToolId::Search, Json{{"branch", "iris"}}) ==
           "Missing required argument: query");
    assert(missing_message(ToolId::Checkout, Json::object()) ==
           "Missing required argument: branch");

    // Optional keys stay unset when absent
    {
        auto a = std::get<LogArgs>(parse_arguments(ToolId::Log, Json{{"branch", "family"}}));
        assert(a.branch == "family");
        assert(!a.limit.has_value());
    }

    // Wrong-typed values pass through in their text form
    {
        auto a = std::get<LogArgs>(
            parse_arguments(ToolId::Log, Json{{"branch", "family"}, {"limit", "five"}}));
        assert(a.limit == std::string("five"));
        auto b = std::get<LogArgs>(
            parse_arguments(ToolId::Log, Json{{"branch", "family"}, {"limit", 25}}));
        assert(b.limit == std::string("25"));
        auto c = std::get<HeadArgs>(parse_arguments(ToolId::Head, Json{{"branch", 7}}));
        assert(c.branch == "7");
        auto d = std::get<RecallArgs>(parse_arguments(ToolId::Recall, Json{{"hash", true}}));
        assert(d.hash == std::string("1"));
        auto e = std::get<RecallArgs>(parse_arguments(ToolId::Recall, Json{{"hash", false}}));
        assert(e.hash == std::string("0"));
        assert(!d.commit.has_value());
    }

    // Search maps every field
    {
        auto a = std::get<SearchArgs>(parse_arguments(
            ToolId::Search, Json{{"query", "bci"}, {"branch", "iris"}, {"limit", 3}}));
        assert(a.query == "bci");
        assert(a.branch == std::string("iris"));
        assert(a.limit == std::string("3"));
    }

    // Commit keeps body values as JSON
    {
        Json content = {{"decision", "ship"}, {"weight", 3}};
        auto a = std::get<CommitArgs>(parse_arguments(
            ToolId::Commit, Json{{"branch", "boswell"}, {"content", content}, {"message", "m"}}));
        assert(a.content == content);
        assert(!a.tags.has_value());

        auto b = std::get<CommitArgs>(
            parse_arguments(ToolId::Commit, Json{{"branch", "boswell"},
                                                 {"content", content},
                                                 {"message", "m"},
                                                 {"tags", Json::array({"x", "y"})}}));
        assert(b.tags.has_value());
        assert(b.tags->size() == 2);
    }

    // Link: link_type defaults to resonance
    {
        Json args = {{"source_blob", "a1"},   {"target_blob", "b2"}, {"source_branch", "iris"},
                     {"target_branch", "family"}, {"reasoning", "same idea"}};
        auto a = std::get<LinkArgs>(parse_arguments(ToolId::Link, args));
        assert(a.link_type == "resonance");

        args["link_type"] = "causal";
        auto b = std::get<LinkArgs>(parse_arguments(ToolId::Link, args));
        assert(b.link_type == "causal");

        args.erase("reasoning");
        assert(missing_message(ToolId::Link, args) == "Missing required argument: reasoning");
    }

    std::cout << "arguments: all checks passed\n";
    return 0;
}
