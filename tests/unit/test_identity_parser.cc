// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/identity/identity_parser.h"

#include <cassert>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "uamask/util/log.h"

using namespace uamask::identity;

namespace {

constexpr std::string_view kEdgeWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "Chrome/119.0.0.0 Safari/537.36 Edg/119.0.2151.58";
constexpr std::string_view kFirefoxWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:109.0) Gecko/20100101 "
    "Firefox/120.0";
constexpr std::string_view kChromeWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
constexpr std::string_view kOperaWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/118.0.0.0 Safari/537.36 OPR/104.0.0.0";
constexpr std::string_view kSafariMac =
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/17.1 Safari/605.1.15";
constexpr std::string_view kChromeLinux =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/119.0.0.0 Safari/537.36";
constexpr std::string_view kChromeAndroid =
    "Mozilla/5.0 (Linux; Android 10; K) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Mobile Safari/537.36";

// Counts diagnostics while in scope
class DiagnosticCounter {
 public:
  DiagnosticCounter() {
    previous_ = uamask::log::SetHandler(
        [this](std::string_view) { ++count_; });
  }
  ~DiagnosticCounter() { uamask::log::SetHandler(std::move(previous_)); }

  int count() const { return count_; }

 private:
  uamask::log::Handler previous_;
  int count_ = 0;
};

}  // namespace

void TestEdgeRoundTrip() {
  std::cout << "Testing Edge on Windows... ";

  IdentityFacts facts = ParseIdentity(kEdgeWindows);
  assert(facts.browser.family == BrowserFamily::kEdge);
  assert(facts.browser.version == 119);
  assert(facts.browser.chromium_version == 119);
  assert(facts.browser.UsesChromium());

  assert(facts.platform.platform_type == "Windows NT 10.0");
  assert(facts.platform.os == "Windows");
  assert(facts.platform.os_version == "NT 10.0; Win64; x64");
  assert(!facts.platform.is_mobile);

  std::cout << "PASSED\n";
}

void TestFirefox() {
  std::cout << "Testing Firefox... ";

  BrowserFacts facts = ParseBrowser(kFirefoxWindows);
  assert(facts.family == BrowserFamily::kFirefox);
  assert(facts.version == 120);
  assert(facts.chromium_version == kUnknownVersion);
  assert(!facts.UsesChromium());

  PlatformFacts platform = ParsePlatform(kFirefoxWindows);
  assert(platform.platform_type == "Windows NT 10.0");

  std::cout << "PASSED\n";
}

void TestChrome() {
  std::cout << "Testing Chrome... ";

  BrowserFacts facts = ParseBrowser(kChromeWindows);
  assert(facts.family == BrowserFamily::kChrome);
  assert(facts.version == 120);
  assert(facts.chromium_version == 120);

  std::cout << "PASSED\n";
}

void TestOperaIsNotChrome() {
  std::cout << "Testing Opera is not reported as Chrome... ";

  BrowserFacts facts = ParseBrowser(kOperaWindows);
  assert(facts.family == BrowserFamily::kOpera);
  assert(facts.version == 104);
  assert(facts.chromium_version == 118);

  std::cout << "PASSED\n";
}

void TestBrandTokensNeverReportChrome() {
  std::cout << "Testing Edge/Opera tokens never yield Chrome... ";

  std::vector<std::string_view> identities = {
      kEdgeWindows,
      kOperaWindows,
      "Mozilla/5.0 (Linux; Android 10; K) AppleWebKit/537.36 (KHTML, like "
      "Gecko) Chrome/120.0.0.0 Mobile Safari/537.36 EdgA/120.0.0.0",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
      "like Gecko) Chrome/70.0.3538.102 Safari/537.36 Edge/18.19045",
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/119.0.0.0 Safari/537.36 OPR/105.0.0.0",
  };
  for (std::string_view identity : identities) {
    BrowserFacts facts = ParseBrowser(identity);
    assert(facts.family != BrowserFamily::kChrome);
    assert(facts.family == BrowserFamily::kEdge ||
           facts.family == BrowserFamily::kOpera);
    assert(facts.UsesChromium());
  }

  assert(ParseBrowser(identities[3]).version == 18);
  assert(ParseBrowser(identities[3]).chromium_version == 70);

  std::cout << "PASSED\n";
}

void TestAlternateFirefoxToken() {
  std::cout << "Testing Firefox for iOS... ";

  BrowserFacts facts = ParseBrowser(
      "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) "
      "AppleWebKit/605.1.15 (KHTML, like Gecko) FxiOS/120.0 Mobile/15E148 "
      "Safari/605.1.15");
  assert(facts.family == BrowserFamily::kFirefox);
  assert(facts.version == 120);
  assert(!facts.UsesChromium());

  std::cout << "PASSED\n";
}

void TestChromiumOnlyWithChromeToken() {
  std::cout << "Testing Chromium family requires a Chrome token... ";

  // Every Chromium family carries a Chromium version and nothing else does
  std::vector<std::string_view> identities = {
      kEdgeWindows,
      kFirefoxWindows,
      kChromeWindows,
      kOperaWindows,
      kSafariMac,
      kChromeLinux,
      kChromeAndroid,
      // Presto Opera
      "Opera/9.80 (Windows NT 6.1; WOW64) Presto/2.12.388 Version/12.16",
      // Edge for iOS
      "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) "
      "AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 "
      "EdgiOS/117.2045.65 Mobile/15E148 Safari/605.1.15",
      // Chrome for iOS
      "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) "
      "AppleWebKit/605.1.15 (KHTML, like Gecko) CriOS/119.0.6045.169 "
      "Mobile/15E148 Safari/604.1",
  };
  for (std::string_view identity : identities) {
    BrowserFacts facts = ParseBrowser(identity);
    bool chromium_family = facts.family == BrowserFamily::kChrome ||
                           facts.family == BrowserFamily::kEdge ||
                           facts.family == BrowserFamily::kOpera;
    assert(facts.UsesChromium() == chromium_family);
  }

  BrowserFacts presto = ParseBrowser(identities[7]);
  assert(presto.family == BrowserFamily::kNone);
  assert(presto.version == kUnknownVersion);

  // WebKit shells on iOS present as Safari
  BrowserFacts edge_ios = ParseBrowser(identities[8]);
  assert(edge_ios.family == BrowserFamily::kSafari);
  assert(edge_ios.version == 605);
  assert(edge_ios.chromium_version == kUnknownVersion);

  BrowserFacts chrome_ios = ParseBrowser(identities[9]);
  assert(chrome_ios.family == BrowserFamily::kSafari);
  assert(chrome_ios.version == 604);
  assert(!chrome_ios.UsesChromium());

  std::cout << "PASSED\n";
}

void TestSafari() {
  std::cout << "Testing Safari on Macintosh... ";

  IdentityFacts facts = ParseIdentity(kSafariMac);
  assert(facts.browser.family == BrowserFamily::kSafari);
  assert(facts.browser.version == 605);
  assert(!facts.browser.UsesChromium());

  assert(facts.platform.platform_type == "Macintosh");
  assert(facts.platform.os == "Intel Mac OS X");
  assert(facts.platform.os_version == "10_15_7");

  std::cout << "PASSED\n";
}

void TestLinux() {
  std::cout << "Testing Chrome on X11... ";

  IdentityFacts facts = ParseIdentity(kChromeLinux);
  assert(facts.browser.family == BrowserFamily::kChrome);
  assert(facts.platform.platform_type == "Linux");
  assert(facts.platform.os == "Linux");
  assert(facts.platform.os_version.empty());

  PlatformFacts ubuntu = ParsePlatform(
      "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:109.0) Gecko/20100101 "
      "Firefox/119.0");
  assert(ubuntu.platform_type == "Linux");
  assert(ubuntu.os == "Ubuntu");

  std::cout << "PASSED\n";
}

void TestAndroidMobile() {
  std::cout << "Testing Chrome on Android... ";

  IdentityFacts facts = ParseIdentity(kChromeAndroid);
  assert(facts.browser.family == BrowserFamily::kChrome);
  assert(facts.platform.platform_type == "Android");
  assert(facts.platform.os == "Android");
  assert(facts.platform.os_version == "10");
  assert(facts.platform.is_mobile);

  std::cout << "PASSED\n";
}

void TestUnknownBrowser() {
  std::cout << "Testing unrecognized identities... ";

  std::vector<std::string_view> identities = {
      "curl/8.4.0",
      "Updater Bot",
      "Mozilla/5.0 (compatible; Googlebot/2.1; +http://www.google.com/bot.html)",
      "",
  };
  for (std::string_view identity : identities) {
    BrowserFacts facts = ParseBrowser(identity);
    assert(facts.family == BrowserFamily::kNone);
    assert(facts.version == kUnknownVersion);
    assert(facts.chromium_version == kUnknownVersion);
  }

  std::cout << "PASSED\n";
}

void TestMalformedVersionDegrades() {
  std::cout << "Testing malformed versions degrade to unknown... ";

  DiagnosticCounter diagnostics;

  BrowserFacts firefox = ParseBrowser("Mozilla/5.0 (X11) Firefox/abc.1");
  assert(firefox.family == BrowserFamily::kFirefox);
  assert(firefox.version == kUnknownVersion);

  BrowserFacts edge = ParseBrowser(
      "Mozilla/5.0 (Windows NT 10.0) Chrome/119.0.0.0 Safari/537.36 Edg/x");
  assert(edge.family == BrowserFamily::kEdge);
  assert(edge.version == kUnknownVersion);
  assert(edge.chromium_version == 119);

  BrowserFacts empty_version = ParseBrowser("Mozilla/5.0 Safari/");
  assert(empty_version.family == BrowserFamily::kSafari);
  assert(empty_version.version == kUnknownVersion);

  assert(diagnostics.count() == 3);

  std::cout << "PASSED\n";
}

void TestParseMajorVersion() {
  std::cout << "Testing ParseMajorVersion... ";

  assert(ParseMajorVersion("119.0.2151.58") == 119);
  assert(ParseMajorVersion("120.0") == 120);
  assert(ParseMajorVersion("99") == 99);
  assert(ParseMajorVersion("119 Safari/537.36") == 119);
  assert(!ParseMajorVersion("").has_value());
  assert(!ParseMajorVersion(".1").has_value());
  assert(!ParseMajorVersion("12a.0").has_value());
  assert(!ParseMajorVersion("99999999999999999999.0").has_value());

  std::cout << "PASSED\n";
}

void TestSystemInfoExtraction() {
  std::cout << "Testing system info extraction... ";

  assert(ExtractSystemInfo(kChromeWindows) == "Windows NT 10.0; Win64; x64");
  assert(ExtractSystemInfo("A (outer (inner) tail) B") ==
         "outer (inner) tail");
  assert(ExtractSystemInfo("no parens").empty());
  assert(ExtractSystemInfo("Mozilla/5.0 (Windows NT 10.0") == "Windows NT 10.0");

  std::cout << "PASSED\n";
}

void TestUnparseablePlatform() {
  std::cout << "Testing unparseable platform is non-fatal... ";

  DiagnosticCounter diagnostics;

  PlatformFacts facts = ParsePlatform("curl/8.4.0");
  assert(facts.platform_type == "curl/8.4.0");
  assert(facts.os.empty());
  assert(facts.os_version.empty());
  assert(!facts.is_mobile);

  PlatformFacts ios = ParsePlatform(
      "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) "
      "AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.1 Mobile/15E148 "
      "Safari/604.1");
  assert(ios.platform_type == "Mozilla/5.0");
  assert(ios.os.empty());

  assert(diagnostics.count() == 2);

  std::cout << "PASSED\n";
}

void TestEmptyIdentity() {
  std::cout << "Testing empty identity... ";

  DiagnosticCounter diagnostics;

  IdentityFacts facts = ParseIdentity("");
  assert(facts.browser.family == BrowserFamily::kNone);
  assert(facts.platform.platform_type.empty());
  assert(facts.platform.os.empty());
  assert(facts.platform.os_version.empty());
  assert(!facts.platform.is_mobile);
  assert(diagnostics.count() == 1);

  std::cout << "PASSED\n";
}

void TestBrandNames() {
  std::cout << "Testing brand names... ";

  assert(BrandName(BrowserFamily::kChrome) == "Google Chrome");
  assert(BrandName(BrowserFamily::kEdge) == "Microsoft Edge");
  assert(BrandName(BrowserFamily::kOpera) == "Opera");
  assert(BrandName(BrowserFamily::kFirefox).empty());
  assert(BrandName(BrowserFamily::kSafari).empty());
  assert(BrandName(BrowserFamily::kNone).empty());

  assert(std::string_view(BrowserFamilyToString(BrowserFamily::kEdge)) ==
         "edge");

  std::cout << "PASSED\n";
}

int main() {
  std::cout << "=== Identity Parser Unit Tests ===\n\n";

  TestEdgeRoundTrip();
  TestFirefox();
  TestChrome();
  TestOperaIsNotChrome();
  TestBrandTokensNeverReportChrome();
  TestAlternateFirefoxToken();
  TestChromiumOnlyWithChromeToken();
  TestSafari();
  TestLinux();
  TestAndroidMobile();
  TestUnknownBrowser();
  TestMalformedVersionDegrades();
  TestParseMajorVersion();
  TestSystemInfoExtraction();
  TestUnparseablePlatform();
  TestEmptyIdentity();
  TestBrandNames();

  std::cout << "\nAll identity parser tests passed!\n";
  return 0;
}
