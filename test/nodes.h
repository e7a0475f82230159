#ifndef NODES_H
#define NODES_H

#include <ast/syntaxNode.hpp>
#include <compiler/resourceCompiler.hpp>

#include <string>
#include <vector>

//Builders for syntax nodes as the resource parser writes them

using l20n::Json;

inline Json str(const std::string& content){
    return Json{{"type", "string"}, {"content", content}};
}

inline Json num(double content){
    return Json{{"type", "number"}, {"content", content}};
}

inline Json var(const std::string& name){
    return Json{{"type", "variable"}, {"name", name}};
}

inline Json ident(const std::string& name){
    return Json{{"type", "identifier"}, {"name", name}};
}

inline Json glob(const std::string& name){
    return Json{{"type", "global"}, {"name", name}};
}

inline Json thisRef(){
    return Json{{"type", "this"}};
}

inline Json complex(const std::vector<Json>& parts){
    return Json{{"type", "complexString"}, {"content", parts}};
}

inline Json array(const std::vector<Json>& elements){
    return Json{{"type", "array"}, {"content", elements}};
}

inline Json markDefault(Json node){
    node["default"] = true;
    return node;
}

inline Json pair(const std::string& id, const Json& value, bool isDefault = false){
    Json node{{"type", "keyValuePair"}, {"id", id}, {"value", value}};
    if(isDefault) node["default"] = true;
    return node;
}

inline Json hash(const std::vector<Json>& pairs){
    return Json{{"type", "hash"}, {"content", pairs}};
}

inline Json unary(const std::string& op, const Json& operand){
    return Json{{"type", "unaryExpression"}, {"operator", op}, {"operand", operand}};
}

inline Json binary(const Json& left, const std::string& op, const Json& right){
    return Json{{"type", "binaryExpression"}, {"left", left}, {"operator", op}, {"right", right}};
}

inline Json logical(const Json& left, const std::string& op, const Json& right){
    return Json{{"type", "logicalExpression"}, {"left", left}, {"operator", op}, {"right", right}};
}

inline Json conditional(const Json& test, const Json& consequent, const Json& alternate){
    return Json{{"type", "conditionalExpression"}, {"test", test}, {"consequent", consequent}, {"alternate", alternate}};
}

inline Json call(const Json& callee, const std::vector<Json>& arguments){
    return Json{{"type", "callExpression"}, {"callee", callee}, {"arguments", arguments}};
}

inline Json property(const Json& expression, const std::string& name){
    return Json{{"type", "propertyExpression"}, {"expression", expression}, {"property", ident(name)}, {"computed", false}};
}

inline Json computedProperty(const Json& expression, const Json& key){
    return Json{{"type", "propertyExpression"}, {"expression", expression}, {"property", key}, {"computed", true}};
}

inline Json attributeOf(const Json& expression, const std::string& name){
    return Json{{"type", "attributeExpression"}, {"expression", expression}, {"attribute", ident(name)}, {"computed", false}};
}

inline Json attribute(const std::string& id, const Json& value){
    return Json{{"type", "attribute"}, {"id", id}, {"value", value}};
}

inline Json entity(const std::string& id, const Json& value,
                   const std::vector<Json>& index = {}, const std::vector<Json>& attrs = {}){
    return Json{{"type", "entity"}, {"id", id}, {"value", value},
                {"index", Json(index)}, {"attrs", Json(attrs)}};
}

inline Json macro(const std::string& id, const std::vector<std::string>& args, const Json& body){
    Json params = Json::array();
    for(const auto& name : args)
        params.push_back(Json{{"type", "variable"}, {"name", name}});
    return Json{{"type", "macro"}, {"id", id}, {"args", params}, {"expression", body}};
}

inline l20n::Resource compileDefinitions(const std::vector<Json>& definitions){
    return l20n::compile(Json(definitions));
}

#endif // NODES_H
