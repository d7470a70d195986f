#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <brsplit/Exception.h>
#include <brsplit/pd/PlacementRule.h>

#include <sstream>

namespace brsplit
{
namespace pd
{
namespace
{
std::string getString(const Poco::JSON::Object::Ptr & obj, const std::string & key)
{
    if (!obj->has(key) || obj->isNull(key))
        return "";
    return obj->getValue<std::string>(key);
}

std::vector<std::string> getStrings(const Poco::JSON::Object::Ptr & obj, const std::string & key)
{
    std::vector<std::string> res;
    if (!obj->has(key) || obj->isNull(key))
        return res;
    auto arr = obj->getArray(key);
    if (arr.isNull())
        throw Exception("field " + key + " is not an array", PlacementRuleError);
    for (size_t i = 0; i < arr->size(); i++)
        res.push_back(arr->getElement<std::string>(i));
    return res;
}

Poco::JSON::Array::Ptr toArray(const std::vector<std::string> & values)
{
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (const auto & v : values)
        arr->add(v);
    return arr;
}
} // namespace

std::string PlacementRule::toJSON() const
{
    Poco::JSON::Object obj;
    obj.set("group_id", group_id);
    obj.set("id", id);
    obj.set("index", index);
    obj.set("override", override_);
    obj.set("start_key", start_key_hex);
    obj.set("end_key", end_key_hex);
    obj.set("role", role);
    obj.set("count", count);

    Poco::JSON::Array::Ptr constraints = new Poco::JSON::Array();
    for (const auto & c : label_constraints)
    {
        Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
        item->set("key", c.key);
        item->set("op", c.op);
        item->set("values", toArray(c.values));
        constraints->add(item);
    }
    obj.set("label_constraints", constraints);
    if (!location_labels.empty())
        obj.set("location_labels", toArray(location_labels));
    if (!isolation_level.empty())
        obj.set("isolation_level", isolation_level);

    std::ostringstream oss;
    obj.stringify(oss);
    return oss.str();
}

PlacementRule PlacementRule::fromJSON(const std::string & json)
{
    try
    {
        Poco::JSON::Parser parser;
        Poco::Dynamic::Var result = parser.parse(json);
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (obj.isNull())
            throw Exception("rule is not a json object", PlacementRuleError);

        PlacementRule rule;
        rule.group_id = getString(obj, "group_id");
        rule.id = getString(obj, "id");
        rule.index = obj->optValue<int>("index", 0);
        rule.override_ = obj->optValue<bool>("override", false);
        rule.start_key_hex = getString(obj, "start_key");
        rule.end_key_hex = getString(obj, "end_key");
        rule.role = getString(obj, "role");
        rule.count = obj->optValue<int>("count", 0);
        if (obj->has("label_constraints") && !obj->isNull("label_constraints"))
        {
            auto arr = obj->getArray("label_constraints");
            if (arr.isNull())
                throw Exception("field label_constraints is not an array", PlacementRuleError);
            for (size_t i = 0; i < arr->size(); i++)
            {
                auto item = arr->getObject(i);
                if (item.isNull())
                    throw Exception("label constraint is not a json object", PlacementRuleError);
                rule.label_constraints.push_back(LabelConstraint{getString(item, "key"), getString(item, "op"), getStrings(item, "values")});
            }
        }
        rule.location_labels = getStrings(obj, "location_labels");
        rule.isolation_level = getString(obj, "isolation_level");
        return rule;
    }
    catch (const Exception &)
    {
        throw;
    }
    catch (const Poco::Exception & e)
    {
        throw Exception("invalid placement rule: " + e.displayText() + ", json: " + json, PlacementRuleError);
    }
}

} // namespace pd
} // namespace brsplit
