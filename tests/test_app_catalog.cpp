#include "ecp/catalog/AppCatalog.hpp"
#include "ecp/catalog/AppCatalogFetcher.hpp"
#include "ecp/core/Error.hpp"

#include "support/DummyHttpServer.hpp"
#include "support/RecordingTransport.hpp"
#include "support/TestAssert.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace ecp;
using namespace ecp::catalog;
using namespace std::chrono_literals;

static const char* kRokuCatalog =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
    "<apps>\n"
    "\t<app id=\"31012\" type=\"menu\" version=\"2.0.53\">Movie Store and TV Store</app>\n"
    "\t<app id=\"12\" subtype=\"ndka\" type=\"appl\" version=\"5.1.2\">Netflix</app>\n"
    "\t<app id=\"2285\" subtype=\"rsga\" type=\"appl\" version=\"7.4.0\">Hulu</app>\n"
    "</apps>\n";

static void testParsesEntityDecodedName() {
    auto apps = parseAppCatalog("<app id=\"12345\" subtype=\"scrn\">Netflix &amp; Chill</app>");
    ASSERT_EQ(apps.size(), std::size_t{1}, "exactly one entry");
    if (apps.size() == 1) {
        ASSERT_EQ(apps[0].id, std::string("12345"), "id verbatim");
        ASSERT_EQ(apps[0].name, std::string("Netflix & Chill"), "name decoded");
    }
}

static void testParsesDeviceDocument() {
    auto apps = parseAppCatalog(kRokuCatalog);
    ASSERT_EQ(apps.size(), std::size_t{3}, "three apps");
    if (apps.size() == 3) {
        ASSERT_EQ(apps[0].id, std::string("31012"), "document order kept");
        ASSERT_EQ(apps[1].name, std::string("Netflix"), "second name");
        ASSERT_EQ(apps[2].id, std::string("2285"), "third id");
    }
}

static void testNoRecordsIsEmpty() {
    ASSERT_TRUE(parseAppCatalog("").empty(), "empty document");
    ASSERT_TRUE(parseAppCatalog("<apps></apps>").empty(), "no app records");
    ASSERT_TRUE(parseAppCatalog("<html><body>Not Found</body></html>").empty(), "unrelated markup");
}

static void testMalformedRecordsAreSkipped() {
    const std::string doc =
        "<app type=\"appl\">No id</app>"
        "<app id=\"\">Empty id</app>"
        "<app id=\"7\"/>"
        "<application id=\"8\">Other element</application>"
        "<app xid=\"9\">Wrong attribute</app>"
        "<app id=\"10\">Never closed"
        "<app id=\"11\">Good</app>"
        "<app id=\"12\">Dangling";
    auto apps = parseAppCatalog(doc);
    ASSERT_EQ(apps.size(), std::size_t{1}, "only the well-formed record");
    if (apps.size() == 1) {
        ASSERT_EQ(apps[0].id, std::string("11"), "good record id");
        ASSERT_EQ(apps[0].name, std::string("Good"), "good record name");
    }
}

static void testDuplicateIdsKeepFirst() {
    auto apps = parseAppCatalog("<app id=\"1\">First</app><app id=\"1\">Second</app><app id=\"2\">Other</app>");
    ASSERT_EQ(apps.size(), std::size_t{2}, "duplicate dropped");
    if (apps.size() == 2) {
        ASSERT_EQ(apps[0].name, std::string("First"), "first kept");
    }
}

static void testEntityDecoding() {
    ASSERT_EQ(decodeHtmlEntities("&lt;b&gt; &quot;x&quot; &apos;y&apos;"),
              std::string("<b> \"x\" 'y'"), "xml entities");
    ASSERT_EQ(decodeHtmlEntities("caf&#233; &#x263A;"),
              std::string("caf\xC3\xA9 \xE2\x98\xBA"), "numeric references");
    ASSERT_EQ(decodeHtmlEntities("Fish &amp Chips"), std::string("Fish &amp Chips"), "no semicolon kept");
    ASSERT_EQ(decodeHtmlEntities("&bogus; &#xZZ; &#0;"), std::string("&bogus; &#xZZ; &#0;"), "unknown kept");
    ASSERT_EQ(decodeHtmlEntities("&amp;amp;"), std::string("&amp;"), "decoded once");
    ASSERT_EQ(decodeHtmlEntities("A&nbsp;B"), std::string("A\xC2\xA0" "B"), "nbsp");
}

static void testFetcherRequestsCatalog() {
    auto transport = std::make_shared<RecordingTransport>();
    transport->setResponse(200, kRokuCatalog);
    AppCatalogFetcher fetcher(CatalogConfig{}, transport);

    auto outcome = fetcher.fetchApps(DeviceAddress("10.0.0.5", 8060));
    ASSERT_EQ(transport->requests().size(), std::size_t{1}, "one request");
    ASSERT_EQ(transport->urls().front(), std::string("http://10.0.0.5:8060/query/apps"), "catalog URL");
    ASSERT_TRUE(transport->requests().front().method == http::Method::Get, "GET");
    ASSERT_TRUE(outcome.isOk(), "fetch ok");
    ASSERT_EQ(outcome.value().size(), std::size_t{3}, "apps parsed");
}

static void testFetcherSwallowsTransportFailure() {
    auto transport = std::make_shared<RecordingTransport>();
    transport->failRequest(1);
    AppCatalogFetcher fetcher(CatalogConfig{}, transport);

    auto outcome = fetcher.fetchApps(DeviceAddress("10.0.0.5", 8060));
    ASSERT_TRUE(outcome.isEmptyOk(), "lenient: swallowed");
    ASSERT_TRUE(outcome.value().empty(), "empty list");
}

static void testStrictFetcherReportsFailure() {
    auto transport = std::make_shared<RecordingTransport>();
    transport->setResponse(404, "<html>Not Found</html>");
    CatalogConfig config;
    config.policy = ErrorPolicy::Strict;
    AppCatalogFetcher fetcher(config, transport);

    auto outcome = fetcher.fetchApps(DeviceAddress("10.0.0.5", 8060));
    ASSERT_TRUE(outcome.isError(), "strict: error");
    ASSERT_TRUE(outcome.error() == make_error_code(Errc::http_status), "status error");
}

static void testLenientErrorStatusIsEmpty() {
    auto transport = std::make_shared<RecordingTransport>();
    transport->setResponse(404, "<html>Not Found</html>");
    AppCatalogFetcher fetcher(CatalogConfig{}, transport);

    auto outcome = fetcher.fetchApps(DeviceAddress("10.0.0.5", 8060));
    ASSERT_TRUE(outcome.isEmptyOk(), "lenient: 404 swallowed");
    ASSERT_TRUE(outcome.value().empty(), "empty list");
    ASSERT_TRUE(outcome.error() == make_error_code(Errc::http_status), "status error kept");
}

static void testNonTextBodyIsRejected() {
    auto transport = std::make_shared<RecordingTransport>();
    transport->setResponse(200, kRokuCatalog);
    transport->setContentType("application/octet-stream");
    AppCatalogFetcher fetcher(CatalogConfig{}, transport);

    auto outcome = fetcher.fetchApps(DeviceAddress("10.0.0.5", 8060));
    ASSERT_TRUE(outcome.isEmptyOk(), "binary body swallowed");
    ASSERT_TRUE(outcome.value().empty(), "nothing parsed");
    ASSERT_TRUE(outcome.error() == make_error_code(Errc::unexpected_content_type), "content type error");

    CatalogConfig strict;
    strict.policy = ErrorPolicy::Strict;
    AppCatalogFetcher strictFetcher(strict, transport);
    ASSERT_TRUE(strictFetcher.fetchApps(DeviceAddress("10.0.0.5", 8060)).isError(), "strict: error");
}

static void testTextualContentTypes() {
    auto transport = std::make_shared<RecordingTransport>();
    transport->setResponse(200, kRokuCatalog);
    AppCatalogFetcher fetcher(CatalogConfig{}, transport);

    for (const char* type : {"text/xml; charset=utf-8", "application/xml", "TEXT/HTML", ""}) {
        transport->setContentType(type);
        auto outcome = fetcher.fetchApps(DeviceAddress("10.0.0.5", 8060));
        ASSERT_TRUE(outcome.isOk(), type);
        ASSERT_EQ(outcome.value().size(), std::size_t{3}, type);
    }
}

static void testFetchOverHttp() {
    DummyHttpServer server;
    server.setResponse(200, "text/xml; charset=utf-8", kRokuCatalog);

    CatalogConfig config;
    config.requestTimeout = 2000ms;
    AppCatalogFetcher fetcher(config);
    auto outcome = fetcher.fetchApps(DeviceAddress("127.0.0.1", server.port()));

    ASSERT_TRUE(outcome.isOk(), "fetch over loopback");
    ASSERT_EQ(outcome.value().size(), std::size_t{3}, "three apps");
    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), std::size_t{1}, "one request on the wire");
    if (!requests.empty()) {
        ASSERT_EQ(requests[0].requestLine, std::string("GET /query/apps HTTP/1.1"), "request line");
    }
}

static void testFetchFromAbsentDevice() {
    CatalogConfig config;
    config.requestTimeout = 1000ms;
    config.connectTimeout = 1000ms;
    AppCatalogFetcher fetcher(config);

    auto outcome = fetcher.fetchApps(DeviceAddress("127.0.0.1", unusedLoopbackPort()));
    ASSERT_TRUE(outcome.isEmptyOk(), "refused connection swallowed");
    ASSERT_TRUE(outcome.value().empty(), "no apps");
}

int main() {
    testParsesEntityDecodedName();
    testParsesDeviceDocument();
    testNoRecordsIsEmpty();
    testMalformedRecordsAreSkipped();
    testDuplicateIdsKeepFirst();
    testEntityDecoding();
    testFetcherRequestsCatalog();
    testFetcherSwallowsTransportFailure();
    testStrictFetcherReportsFailure();
    testLenientErrorStatusIsEmpty();
    testNonTextBodyIsRejected();
    testTextualContentTypes();
    testFetchOverHttp();
    testFetchFromAbsentDevice();
    return finishTests("AppCatalog tests");
}
