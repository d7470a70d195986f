#include <Poco/JSON/Object.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>
#include <brsplit/Exception.h>
#include <brsplit/pd/HttpClient.h>

#include <memory>
#include <sstream>

namespace brsplit
{
namespace pd
{
static const std::string rule_api_prefix = "/pd/api/v1/config/rule";
static const std::string store_api_prefix = "/pd/api/v1/store/";

std::string HttpClient::getPDAPIAddr()
{
    std::string addr = pd_client->getLeaderUrl();
    if (addr.empty())
        throw Exception("no pd leader found", PDLeaderNotFound);
    if (addr.rfind("http", 0) != 0)
        addr = "http://" + addr;
    while (!addr.empty() && addr.back() == '/')
        addr.pop_back();
    return addr;
}

std::string HttpClient::sendRequest(const std::string & method, const std::string & path, const std::string & body)
{
    const std::string url = getPDAPIAddr() + path;
    try
    {
        Poco::URI uri(url);
        std::unique_ptr<Poco::Net::HTTPClientSession> session;
        if (uri.getScheme() == "https")
        {
            Poco::Net::Context::Ptr context = new Poco::Net::Context(
                Poco::Net::Context::CLIENT_USE,
                config.key_path,
                config.cert_path,
                config.ca_path,
                Poco::Net::Context::VERIFY_RELAXED);
            session = std::make_unique<Poco::Net::HTTPSClientSession>(uri.getHost(), uri.getPort(), context);
        }
        else
        {
            session = std::make_unique<Poco::Net::HTTPClientSession>(uri.getHost(), uri.getPort());
        }
        session->setTimeout(Poco::Timespan(timeout, 0));

        Poco::Net::HTTPRequest req(method, uri.getPathAndQuery(), Poco::Net::HTTPMessage::HTTP_1_1);
        if (!body.empty())
            req.setContentType("application/json");
        req.setContentLength(body.size());
        auto & ostream = session->sendRequest(req);
        ostream << body;

        Poco::Net::HTTPResponse res;
        auto & istream = session->receiveResponse(res);
        std::string resp_body;
        Poco::StreamCopier::copyToString(istream, resp_body);

        if (res.getStatus() < 200 || res.getStatus() >= 300)
        {
            std::string err_msg = method + " " + url + " failed, status: " + std::to_string(res.getStatus()) + ", body: " + resp_body;
            log->warning(err_msg);
            throw Exception(err_msg, PlacementRuleError);
        }
        return resp_body;
    }
    catch (const Exception &)
    {
        throw;
    }
    catch (const Poco::Exception & e)
    {
        std::string err_msg = method + " " + url + " failed: " + e.displayText();
        log->warning(err_msg);
        throw Exception(err_msg, PlacementRuleError);
    }
}

PlacementRule HttpClient::getPlacementRule(const std::string & group_id, const std::string & rule_id)
{
    auto body = sendRequest(Poco::Net::HTTPRequest::HTTP_GET, rule_api_prefix + "/" + group_id + "/" + rule_id, "");
    return PlacementRule::fromJSON(body);
}

void HttpClient::setPlacementRule(const PlacementRule & rule)
{
    sendRequest(Poco::Net::HTTPRequest::HTTP_POST, rule_api_prefix, rule.toJSON());
    log->information("set placement rule " + rule.group_id + "/" + rule.id);
}

void HttpClient::deletePlacementRule(const std::string & group_id, const std::string & rule_id)
{
    sendRequest(Poco::Net::HTTPRequest::HTTP_DELETE, rule_api_prefix + "/" + group_id + "/" + rule_id, "");
    log->information("delete placement rule " + group_id + "/" + rule_id);
}

void HttpClient::setStoresLabel(const std::vector<uint64_t> & store_ids, const std::string & label_key, const std::string & label_value)
{
    Poco::JSON::Object label;
    label.set(label_key, label_value);
    std::ostringstream oss;
    label.stringify(oss);
    const std::string body = oss.str();

    for (auto id : store_ids)
    {
        sendRequest(Poco::Net::HTTPRequest::HTTP_POST, store_api_prefix + std::to_string(id) + "/label", body);
        log->debug("set label " + label_key + "=" + label_value + " on store " + std::to_string(id));
    }
}

} // namespace pd
} // namespace brsplit
