#include <compiler/resourceCompiler.hpp>
#include <runtime/errors.hpp>
#include "nodes.h"
#include "report.h"

using namespace l20n;

static size_t countSeverity(const std::vector<Diagnostic>& diagnostics, DiagnosticSeverity severity){
    size_t count = 0;
    for(const auto& diagnostic : diagnostics)
        if(diagnostic.severity == severity) count++;
    return count;
}

static bool testDefinitionOrder(){
    bool passing = true;

    Resource resource;
    ResourceCompiler compiler;
    bool compiled = compiler.compile(Json::array({
        entity("b", str("B")),
        macro("a", {}, str("A")),
        Json{{"type", "comment"}, {"content", "ignored"}},
        entity("c", str("C")),
    }), resource);

    passing &= expectTrue(compiled, "compile succeeds", __LINE__);
    passing &= expectTrue(resource.ids() == std::vector<std::string>{"b", "a", "c"}, "definition order kept", __LINE__);
    passing &= expectTrue(resource.entity("b") != nullptr && resource.macro("a") != nullptr, "entries by kind", __LINE__);
    passing &= expectTrue(resource.entity("a") == nullptr && resource.macro("b") == nullptr, "kinds are not mixed", __LINE__);
    passing &= expectTrue(isUndefined(resource.lookup("missing")), "absent id", __LINE__);

    passing &= expectTrue(compiler.diagnostics().size() == 1, "one diagnostic", __LINE__);
    if(!compiler.diagnostics().empty()){
        const Diagnostic& skipped = compiler.diagnostics().front();
        passing &= expectTrue(skipped.severity == DiagnosticSeverity::Information, "skipped kind is informational", __LINE__);
        passing &= expectTrue(skipped.position == 2, "position of skipped definition", __LINE__);
    }

    Json document{{"type", "L20n"}, {"body", Json::array({entity("only", str("one"))})}};
    Resource fromDocument = compile(document);
    Context context(&fromDocument);
    passing &= expectText(fromDocument.entity("only")->get(context, {}), "one", __LINE__);

    Json keyed = entity("ignored", str("keyed"));
    keyed["id"] = ident("keyed");
    Resource fromIdentifier = compile(Json::array({keyed}));
    passing &= expectTrue(fromIdentifier.contains("keyed") && !fromIdentifier.contains("ignored"),
                          "id given as identifier node", __LINE__);

    report("Definition order", passing);
    return passing;
}

static bool testDuplicateIds(){
    bool passing = true;

    std::vector<Json> definitions = {
        entity("x", str("first")),
        entity("y", str("between")),
        entity("x", str("second")),
    };

    Resource resource;
    ResourceCompiler compiler;
    passing &= expectTrue(compiler.compile(Json(definitions), resource), "redefinition is not an error", __LINE__);
    Context context(&resource);
    passing &= expectText(resource.entity("x")->get(context, {}), "second", __LINE__);
    passing &= expectTrue(resource.ids() == std::vector<std::string>{"x", "y"}, "first position kept", __LINE__);
    passing &= expectTrue(countSeverity(compiler.diagnostics(), DiagnosticSeverity::Warning) == 1, "redefinition warning", __LINE__);

    CompilerOptions options;
    options.rejectDuplicateIds = true;
    Resource strictResource;
    ResourceCompiler strict(options);
    passing &= expectTrue(!strict.compile(Json(definitions), strictResource), "duplicate rejected", __LINE__);
    Context strictContext(&strictResource);
    passing &= expectText(strictResource.entity("x")->get(strictContext, {}), "first", __LINE__);
    passing &= expectTrue(strict.hasErrors(), "error reported", __LINE__);
    passing &= expectTrue(!strict.malformedNode(), "duplicate id is not a malformed node", __LINE__);
    if(!strict.diagnostics().empty())
        passing &= expectText(strict.diagnostics().front().toString(), "Error at definition 2 (x): duplicate id 'x'", __LINE__);

    //Later compiles start from a clean diagnostic list
    Resource other;
    passing &= expectTrue(strict.compile(Json::array({entity("z", str("z"))}), other), "fresh compile", __LINE__);
    passing &= expectTrue(strict.diagnostics().empty(), "diagnostics cleared", __LINE__);

    report("Duplicate ids", passing);
    return passing;
}

static bool testMalformedDefinitions(){
    bool passing = true;

    Json noId{{"type", "entity"}, {"value", str("lost")}};
    std::vector<Json> definitions = {
        entity("before", str("kept")),
        entity("empty", array({})),
        noId,
        entity("after", str("kept too")),
    };

    Resource resource;
    ResourceCompiler compiler;
    passing &= expectTrue(!compiler.compile(Json(definitions), resource), "malformed definitions fail", __LINE__);
    passing &= expectTrue(resource.ids() == std::vector<std::string>{"before", "after"}, "valid definitions kept", __LINE__);
    passing &= expectTrue(countSeverity(compiler.diagnostics(), DiagnosticSeverity::Error) == 2, "one error per definition", __LINE__);
    if(compiler.diagnostics().size() == 2){
        passing &= expectTrue(compiler.diagnostics()[0].entryId == "empty" && compiler.diagnostics()[0].position == 1,
                              "error names the definition", __LINE__);
        passing &= expectTrue(compiler.diagnostics()[1].entryId.empty() && compiler.diagnostics()[1].position == 2,
                              "error without id", __LINE__);
    }

    passing &= expectTrue(compiler.malformedNode().has_value(), "first malformed definition kept", __LINE__);
    if(compiler.malformedNode())
        passing &= expectText(compiler.malformedNode()->what(), "Malformed node: array literal has no elements", __LINE__);

    Resource nothing;
    passing &= expectTrue(!compiler.compile(Json(42), nothing), "non-array resource", __LINE__);
    passing &= expectTrue(nothing.empty(), "nothing compiled", __LINE__);

    passing &= expectThrow<MalformedNodeError>([&]{ compile(Json(definitions)); }, "compile with defaults", __LINE__);
    passing &= expectThrow<MalformedNodeError>([]{ compile(Json{{"type", "L20n"}}); }, "document without body", __LINE__);
    try{
        compile(Json::array({entity("e", Json{{"type", "bogus"}})}));
        passing &= expectTrue(false, "unknown node kind in a definition", __LINE__);
    }catch(const MalformedNodeError& e){
        passing &= expectText(e.what(), "Malformed node: unknown node type 'bogus'", __LINE__);
    }

    Diagnostic warning("check this", "", -1, DiagnosticSeverity::Warning);
    passing &= expectText(warning.toString(), "Warning: check this", __LINE__);
    Diagnostic named("bad value", "title");
    passing &= expectText(named.toString(), "Error at title: bad value", __LINE__);

    report("Malformed definitions", passing);
    return passing;
}

inline bool testCompile(){
    bool passing = true;

    passing &= testDefinitionOrder();
    passing &= testDuplicateIds();
    passing &= testMalformedDefinitions();

    return passing;
}
