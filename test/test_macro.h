#include <compiler/resourceCompiler.hpp>
#include <runtime/errors.hpp>
#include "nodes.h"
#include "report.h"

using namespace l20n;

//Calls the macro and drives its result to text
static std::string callText(const Macro* macro, const std::vector<Value>& arguments,
                            const Context& context, const Scope& data = {}){
    Resolution resolution(context, data);
    return resolution.toText(macro->call(arguments, resolution));
}

static Json pluralBody(){
    return conditional(binary(var("n"), "==", num(1)), str("one"), str("many"));
}

static bool testMacroArguments(){
    bool passing = true;

    Resource resource = compileDefinitions({
        macro("pick", {"a", "b"}, logical(var("b"), "||", var("a"))),
        macro("greet", {"name"}, complex({str("Hi "), var("name")})),
        macro("inner", {}, var("x")),
        macro("outer", {"x"}, call(ident("inner"), {})),
    });
    Context context(&resource);
    const Macro* pick = resource.macro("pick");

    passing &= expectTrue(pick->parameters() == std::vector<std::string>{"a", "b"}, "parameter names", __LINE__);
    passing &= expectText(callText(pick, {Value(std::string("x"))}, context), "x", __LINE__);
    passing &= expectText(callText(pick, {Value(std::string("x")), Value(std::string("y"))}, context), "y", __LINE__);
    passing &= expectTrue(isUndefined(pick->call({}, context, {})), "no arguments at all", __LINE__);

    const Macro* greet = resource.macro("greet");
    Scope data{{"name", Value(std::string("Ann"))}};
    passing &= expectText(callText(greet, {Value(std::string("Bo"))}, context, data), "Hi Bo", __LINE__);
    passing &= expectText(callText(greet, {}, context, data), "Hi Ann", __LINE__);
    passing &= expectText(callText(greet, {Value(Undefined{})}, context, data), "Hi Ann", __LINE__);

    //The caller's arguments are not visible inside a nested call
    const Macro* outer = resource.macro("outer");
    passing &= expectTrue(isUndefined(outer->call({Value(std::string("local"))}, context, {})),
                          "outer binding hidden from inner macro", __LINE__);
    passing &= expectText(callText(outer, {Value(std::string("local"))}, context,
                                   {{"x", Value(std::string("data"))}}), "data", __LINE__);

    report("Macro arguments", passing);
    return passing;
}

static bool testMacroCalls(){
    bool passing = true;

    Resource resource = compileDefinitions({
        macro("plural", {"n"}, pluralBody()),
        entity("files", hash({pair("one", str("one file")), pair("many", complex({var("count"), str(" files")}))}),
               {call(ident("plural"), {var("count")})}),
        entity("viaGlobal", call(glob("plural"), {num(1)})),
        macro("choose", {}, hash({pair("a", str("alpha")), pair("b", str("beta"), true)})),
        entity("plain", str("text")),
        entity("notCallable", call(ident("plain"), {})),
        entity("bareMacro", ident("plural")),
    });
    Context context(&resource, Scope{{"plural", Value(resource.macro("plural"))}});

    const Entity* files = resource.entity("files");
    passing &= expectText(files->get(context, {{"count", Value(1.0)}}), "one file", __LINE__);
    passing &= expectText(files->get(context, {{"count", Value(5.0)}}), "5 files", __LINE__);
    passing &= expectText(files->get(context, {{"count", Value(0.0)}}), "0 files", __LINE__);

    passing &= expectText(resource.entity("viaGlobal")->get(context, {}), "one", __LINE__);

    const Macro* choose = resource.macro("choose");
    passing &= expectTrue(std::holds_alternative<Thunk>(choose->call({}, context, {})),
                          "hash body stays unselected", __LINE__);
    passing &= expectText(callText(choose, {}, context), "beta", __LINE__);

    passing &= expectThrow<TypeMismatchError>([&]{ resource.entity("notCallable")->get(context, {}); },
                                              "calling an entity", __LINE__);
    passing &= expectThrow<TypeMismatchError>([&]{ resource.entity("bareMacro")->get(context, {}); },
                                              "macro used as text", __LINE__);

    report("Macro calls", passing);
    return passing;
}

inline bool testMacros(){
    bool passing = true;

    passing &= testMacroArguments();
    passing &= testMacroCalls();

    return passing;
}
