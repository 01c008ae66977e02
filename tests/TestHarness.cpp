#include <algorithm>
#include <atomic>
#include <cerrno>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "../src/ArpTable.hpp"
#include "../src/DeviceClassifier.hpp"
#include "../src/DeviceRegistry.hpp"
#include "../src/MdnsCodec.hpp"
#include "../src/NetworkTopology.hpp"
#include "../src/ScanConfig.hpp"
#include "../src/ScanEvents.hpp"
#include "../src/ServiceListener.hpp"
#include "../src/TcpProber.hpp"
#include "../src/WorkerPool.hpp"

using namespace Camscout;

static Device makeDevice(const std::string& ip, DeviceRole role, DeviceStatus status, const std::string& rangeKey) {
    Device d;
    d.ip = ip;
    d.role = role;
    d.id = makeDeviceId(role, ip);
    d.status = status;
    d.rangeKey = rangeKey;
    d.model = "M3106-L";
    d.discoveredAt = nowIso8601();
    return d;
}

int main(){
    int failures = 0;

    // Test 1: host enumeration edge cases
    {
        auto r32 = parseCidr("10.1.2.3/32");
        auto r31 = parseCidr("10.1.2.2/31");
        auto r30 = parseCidr("192.168.1.0/30");
        auto r24 = parseCidr("192.168.1.77/24");
        if (!r32 || !candidateHosts(*r32).empty()) {
            std::cerr << "[FAIL] /32 should yield no hosts\n";
            ++failures;
        }
        if (!r31 || !candidateHosts(*r31).empty()) {
            std::cerr << "[FAIL] /31 should yield no hosts\n";
            ++failures;
        }
        if (!r30) {
            std::cerr << "[FAIL] /30 did not parse\n";
            ++failures;
        } else {
            auto hosts = candidateHosts(*r30);
            if (hosts != std::vector<std::string>{"192.168.1.1", "192.168.1.2"}) {
                std::cerr << "[FAIL] /30 hosts: got " << hosts.size() << "\n";
                ++failures;
            }
        }
        if (!r24 || r24->cidr() != "192.168.1.0/24" || candidateHosts(*r24).size() != 254) {
            std::cerr << "[FAIL] /24 with host bits should mask to 192.168.1.0/24 with 254 hosts\n";
            ++failures;
        }
        if (parseCidr("192.168.1.0/8") || parseCidr("300.1.1.1/24") || parseCidr("abc") ||
            parseCidr("10.0.0.0/33") || parseCidr("10.0.0.0/")) {
            std::cerr << "[FAIL] Invalid CIDR accepted\n";
            ++failures;
        }
        auto bare = parseCidr("10.0.0.9");
        if (!bare || bare->prefixLength != 24) {
            std::cerr << "[FAIL] Address without prefix should default to /24\n";
            ++failures;
        }
    }

    // Test 2: range planning order and virtual interface handling
    {
        std::vector<InterfaceInfo> ifaces = {
            {"docker0", "172.17.0.1", "255.255.0.0", 16, true},
            {"wlan0", "192.168.50.20", "255.255.255.0", 24, true},
            {"ppp0", "10.64.0.5", "255.255.255.0", 24, true},
            {"eth0", "10.0.0.14", "255.255.0.0", 16, true},
            {"eth1", "10.0.0.15", "255.255.0.0", 16, true},
        };
        auto ranges = planRanges(ifaces);
        if (ranges.size() != 3) {
            std::cerr << "[FAIL] Expected 3 ranges, got " << ranges.size() << "\n";
            ++failures;
        } else {
            if (!ranges[0].physical || !ranges[1].physical || ranges[2].interfaceName != "ppp0") {
                std::cerr << "[FAIL] Physical ranges should come first\n";
                ++failures;
            }
            // eth0's /16 is narrowed to the /24 around its address
            auto eth = std::find_if(ranges.begin(), ranges.end(),
                                    [](const NetworkRange& r) { return r.interfaceName == "eth0"; });
            if (eth == ranges.end() || eth->cidr() != "10.0.0.0/24") {
                std::cerr << "[FAIL] Wide range not narrowed to /24\n";
                ++failures;
            }
            for (const auto& r : ranges) {
                if (r.interfaceName == "docker0") {
                    std::cerr << "[FAIL] Virtual interface planned while physical ones exist\n";
                    ++failures;
                }
            }
        }
        auto onlyVirtual = planRanges({{"docker0", "172.17.0.1", "255.255.255.0", 24, true}});
        if (onlyVirtual.size() != 1) {
            std::cerr << "[FAIL] Virtual interface should be used when nothing else exists\n";
            ++failures;
        }
        if (!planRanges({}).empty()) {
            std::cerr << "[FAIL] No interfaces should plan no ranges\n";
            ++failures;
        }
        if (classifyInterface("en0") != InterfaceKind::Physical || classifyInterface("veth12ab") != InterfaceKind::Virtual ||
            classifyInterface("utun3") != InterfaceKind::Virtual) {
            std::cerr << "[FAIL] Interface classification\n";
            ++failures;
        }
    }

    // Test 3: prioritized order puts common camera suffixes first and keeps every host
    {
        auto range = parseCidr("192.168.7.0/24");
        std::mt19937 rng(42);
        auto ordered = prioritizedHosts(*range, rng);
        auto plain = candidateHosts(*range);
        std::set<std::string> a(ordered.begin(), ordered.end()), b(plain.begin(), plain.end());
        if (ordered.size() != plain.size() || a != b) {
            std::cerr << "[FAIL] Prioritized hosts are not a permutation\n";
            ++failures;
        }
        // .100-.200 plus .64 and .88 (.156 is already inside the block)
        const size_t common = 101 + 2;
        for (size_t i = 0; i < ordered.size(); ++i) {
            bool isCommon = isCommonCameraSuffix(*parseIpv4(ordered[i]));
            if ((i < common) != isCommon) {
                std::cerr << "[FAIL] Host " << ordered[i] << " out of priority order at " << i << "\n";
                ++failures;
                break;
            }
        }
    }

    // Test 4: brand parameters and classification
    {
        std::string camera = "root.Brand.Brand=AXIS\r\nroot.Brand.ProdNbr=M3106-L Mk II\r\n"
                             "root.Brand.ProdType=Network Camera\r\nroot.Brand.SerialNumber=ACCC8E0A1B2C\r\n";
        BrandInfo info = parseBrandParameters(camera);
        if (info.brand != "AXIS" || info.prodNbr != "M3106-L Mk II" || info.prodType != "Network Camera") {
            std::cerr << "[FAIL] Brand parse: brand=" << info.brand << " nbr=" << info.prodNbr << "\n";
            ++failures;
        }
        if (classify(info) != Classification::Camera) {
            std::cerr << "[FAIL] Camera not classified as camera\n";
            ++failures;
        }
        // Same text twice, same answer
        if (classify(parseBrandParameters(camera)) != classify(parseBrandParameters(camera))) {
            std::cerr << "[FAIL] Classification is not repeatable\n";
            ++failures;
        }
        auto mac = macFromSerial(info.serialNumber);
        if (!mac || *mac != "AC:CC:8E:0A:1B:2C") {
            std::cerr << "[FAIL] MAC from serial: " << (mac ? *mac : "none") << "\n";
            ++failures;
        }

        BrandInfo speaker = parseBrandParameters("Brand.Brand=AXIS\nBrand.ProdType=Network Horn Speaker\n");
        if (classify(speaker) != Classification::Speaker) {
            std::cerr << "[FAIL] Horn speaker not classified as speaker\n";
            ++failures;
        }
        for (const char* type : {"Audio Bridge", "Sound Module", "Network Speaker"}) {
            BrandInfo b;
            b.brand = "AXIS";
            b.prodType = type;
            if (classify(b) != Classification::Speaker) {
                std::cerr << "[FAIL] " << type << " not classified as speaker\n";
                ++failures;
            }
        }
        BrandInfo other = parseBrandParameters("Brand=Hikvision\nProdType=Network Camera\n");
        if (classify(other) != Classification::NotSupported) {
            std::cerr << "[FAIL] Other vendor should not be supported\n";
            ++failures;
        }
        for (const char* text : {"Brand=Sonos\nProdType=Network Audio Speaker\n", "ProdType=Sound Bar\n"}) {
            if (classify(parseBrandParameters(text)) != Classification::NotSupported) {
                std::cerr << "[FAIL] Speaker type without the vendor marker accepted: " << text << "\n";
                ++failures;
            }
        }
        if (classify(parseBrandParameters("<html>router login</html>")) != Classification::NotSupported) {
            std::cerr << "[FAIL] Unrelated page should not be supported\n";
            ++failures;
        }
        if (macFromSerial("ACCC8E") || macFromSerial("ZZCC8E0A1B2C")) {
            std::cerr << "[FAIL] Invalid serial accepted as MAC\n";
            ++failures;
        }
    }

    // Test 5: registry merge rules
    {
        DeviceRegistry reg;
        Device a = makeDevice("10.0.0.10", DeviceRole::Camera, DeviceStatus::Accessible, "eth0/10.0.0.0/24");
        if (reg.upsert(a) != UpsertResult::Added || reg.upsert(a) != UpsertResult::Unchanged) {
            std::cerr << "[FAIL] Add then identical upsert\n";
            ++failures;
        }

        // A weaker status never overwrites an accessible entry
        Device weaker = a;
        weaker.status = DeviceStatus::RequiresAuth;
        weaker.error = "Invalid username or password";
        reg.upsert(weaker);
        if (reg.findByIp("10.0.0.10")->status != DeviceStatus::Accessible) {
            std::cerr << "[FAIL] Accessible entry downgraded\n";
            ++failures;
        }

        // Same MAC on a second address folds into the first entry
        Device withMac = a;
        withMac.mac = "AC:CC:8E:00:00:01";
        reg.upsert(withMac);
        Device alias = makeDevice("10.0.0.99", DeviceRole::Camera, DeviceStatus::Accessible, "eth0/10.0.0.0/24");
        alias.mac = "AC:CC:8E:00:00:01";
        Device stored;
        reg.upsert(alias, &stored);
        if (reg.size() != 1 || stored.ip != "10.0.0.10" ||
            stored.alternateAddresses != std::vector<std::string>{"10.0.0.99"}) {
            std::cerr << "[FAIL] MAC merge: size=" << reg.size() << "\n";
            ++failures;
        }
        if (!reg.contains("10.0.0.99") || reg.findByIp("10.0.0.99")->ip != "10.0.0.10") {
            std::cerr << "[FAIL] Alternate address lookup\n";
            ++failures;
        }

        // Pairing stays inside one range pass
        Device speaker = makeDevice("10.0.0.20", DeviceRole::Speaker, DeviceStatus::Accessible, "eth0/10.0.0.0/24");
        Device farCamera = makeDevice("192.168.9.10", DeviceRole::Camera, DeviceStatus::Accessible, "wlan0/192.168.9.0/24");
        reg.upsert(speaker);
        reg.upsert(farCamera);
        auto changed = reg.attachPeripherals("eth0/10.0.0.0/24");
        if (changed.size() != 1 || !reg.findByIp("10.0.0.10")->pairedPeripheral ||
            *reg.findByIp("10.0.0.10")->pairedPeripheral != "10.0.0.20") {
            std::cerr << "[FAIL] Camera not paired with same-range speaker\n";
            ++failures;
        }
        if (reg.findByIp("192.168.9.10")->pairedPeripheral) {
            std::cerr << "[FAIL] Camera paired across ranges\n";
            ++failures;
        }
        if (!reg.attachPeripherals("eth0/10.0.0.0/24").empty()) {
            std::cerr << "[FAIL] Pairing repeated\n";
            ++failures;
        }
        if (reg.cameras().size() != 2 || reg.speakers().size() != 1) {
            std::cerr << "[FAIL] Role views: cameras=" << reg.cameras().size() << "\n";
            ++failures;
        }
        for (const auto& d : reg.all()) {
            if (d.role == DeviceRole::Speaker && d.pairedPeripheral) {
                std::cerr << "[FAIL] Speaker carries a peripheral\n";
                ++failures;
            }
        }

        // Status moves from requires_auth to accessible once credentials work
        Device locked = makeDevice("10.0.0.30", DeviceRole::Unknown, DeviceStatus::RequiresAuth, "manual");
        reg.upsert(locked);
        Device unlocked = makeDevice("10.0.0.30", DeviceRole::Camera, DeviceStatus::Accessible, "manual");
        if (reg.upsert(unlocked) != UpsertResult::Updated ||
            reg.findByIp("10.0.0.30")->status != DeviceStatus::Accessible ||
            reg.findByIp("10.0.0.30")->id != "camera-10-0-0-30") {
            std::cerr << "[FAIL] requires_auth -> accessible transition\n";
            ++failures;
        }
        if (!reg.findById("camera-10-0-0-30")) {
            std::cerr << "[FAIL] findById after role change\n";
            ++failures;
        }
    }

    // Test 6: mDNS records split across packets still resolve to one announcement
    {
        using namespace Mdns;
        ResourceRecord ptr;
        ptr.name = "_axis-video._tcp.local";
        ptr.type = TypePTR;
        ptr.target = "AXIS M3106-L - ACCC8E012345._axis-video._tcp.local";
        ResourceRecord txt;
        txt.name = ptr.target;
        txt.type = TypeTXT;
        txt.txt = {{"macaddress", "ACCC8E012345"}};
        ResourceRecord srv;
        srv.name = ptr.target;
        srv.type = TypeSRV;
        srv.port = 80;
        srv.target = "axis-accc8e012345.local";
        ResourceRecord a;
        a.name = "axis-accc8e012345.local";
        a.type = TypeA;
        a.address = "192.168.1.90";

        auto first = buildResponse({ptr, txt});
        auto second = buildResponse({srv, a});
        auto m1 = parseMessage(first.data(), first.size());
        auto m2 = parseMessage(second.data(), second.size());
        if (!m1 || !m2 || !m1->isResponse() || m1->records.size() != 2) {
            std::cerr << "[FAIL] mDNS response did not parse\n";
            ++failures;
        } else {
            AnnouncementAssembler assembler;
            assembler.feed(*m1, "192.168.1.90");
            assembler.feed(*m2, "192.168.1.90");
            auto found = assembler.announcements();
            if (found.size() != 1 || found[0].ip != "192.168.1.90" || found[0].port != 80 ||
                found[0].instance != "axis m3106-l - accc8e012345._axis-video._tcp.local") {
                std::cerr << "[FAIL] Assembled announcements: " << found.size() << "\n";
                ++failures;
            } else if (!isVendorAnnouncement(found[0])) {
                std::cerr << "[FAIL] Vendor announcement not recognised\n";
                ++failures;
            }
        }

        ServiceAnnouncement printer;
        printer.instance = "office printer._http._tcp.local";
        printer.serviceType = "_http._tcp.local";
        printer.txt = {{"manufacturer", "Brother"}};
        if (isVendorAnnouncement(printer)) {
            std::cerr << "[FAIL] Printer treated as a camera announcement\n";
            ++failures;
        }

        auto query = buildQuery(defaultServiceTypes(), true);
        auto q = parseMessage(query.data(), query.size());
        if (!q || q->isResponse() || q->questions.size() != 3 || q->questions[0] != "_axis-video._tcp.local") {
            std::cerr << "[FAIL] Query round trip\n";
            ++failures;
        }

        // Compression pointer pointing at itself must not loop
        std::vector<std::uint8_t> evil = {0, 0, 0x84, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0xC0, 12};
        if (parseMessage(evil.data(), evil.size())) {
            std::cerr << "[FAIL] Self-referencing name accepted\n";
            ++failures;
        }
        if (parseMessage(evil.data(), 5)) {
            std::cerr << "[FAIL] Truncated header accepted\n";
            ++failures;
        }
    }

    // Test 7: kernel ARP table text
    {
        std::string text =
            "IP address       HW type     Flags       HW address            Mask     Device\n"
            "192.168.1.90     0x1         0x2         ac:cc:8e:01:23:45     *        eth0\n"
            "192.168.1.91     0x1         0x0         00:00:00:00:00:00     *        eth0\n";
        auto entries = ArpTable::parse(text);
        if (entries.size() != 1 || entries["192.168.1.90"] != "AC:CC:8E:01:23:45") {
            std::cerr << "[FAIL] ARP parse: " << entries.size() << " entries\n";
            ++failures;
        }
        ArpTable missing("/nonexistent/arp");
        if (missing.lookup("192.168.1.90")) {
            std::cerr << "[FAIL] Lookup in a missing table\n";
            ++failures;
        }
    }

    // Test 8: configuration arguments
    {
        ScanConfig config;
        std::string error;
        bool ok = config.applyArgument("--cidr=10.0.0.0/24", error) &&
                  config.applyArgument("--ports=443,80,8080", error) &&
                  config.applyArgument("--credentials=root:pa:ss", error) &&
                  config.applyArgument("--concurrency=500", error) &&
                  config.applyArgument("--policy=limit", error) &&
                  config.applyArgument("--no-services", error);
        if (!ok) {
            std::cerr << "[FAIL] Valid arguments rejected: " << error << "\n";
            ++failures;
        }
        if (!config.cidrOverride || *config.cidrOverride != "10.0.0.0/24" ||
            config.ports != std::vector<int>{443, 80, 8080} || config.credentials.size() != 1 ||
            config.credentials[0].password != "pa:ss" || config.useServiceDiscovery ||
            config.subnetPolicy != SubnetPolicy::StopAtDeviceLimit) {
            std::cerr << "[FAIL] Arguments not applied\n";
            ++failures;
        }
        if (config.effectiveConcurrency() != ScanConfig::kMaxConcurrency) {
            std::cerr << "[FAIL] Concurrency not clamped: " << config.effectiveConcurrency() << "\n";
            ++failures;
        }
        if (config.applyArgument("--bogus=1", error) || error.empty()) {
            std::cerr << "[FAIL] Unknown argument accepted\n";
            ++failures;
        }
        if (parsePortList("80,0") || parsePortList("80,x") || parsePortList("70000")) {
            std::cerr << "[FAIL] Invalid port list accepted\n";
            ++failures;
        }
        ScanConfig defaults;
        if (defaults.effectivePorts() != std::vector<int>{443, 80, 8080, 8000, 8443, 81, 8081} ||
            defaults.concurrency != 20 || defaults.subnetPolicy != SubnetPolicy::ScanAllHosts) {
            std::cerr << "[FAIL] Defaults\n";
            ++failures;
        }
    }

    // Test 9: JSON output escapes and never carries the password
    {
        Device d = makeDevice("10.0.0.10", DeviceRole::Camera, DeviceStatus::Accessible, "eth0/10.0.0.0/24");
        d.model = "M\"31\\06";
        d.credentials = CredentialSet{"root", "s3cret"};
        std::string json = deviceToJson(d);
        if (json.find("s3cret") != std::string::npos) {
            std::cerr << "[FAIL] Password leaked into JSON\n";
            ++failures;
        }
        if (json.find("\"model\":\"M\\\"31\\\\06\"") == std::string::npos) {
            std::cerr << "[FAIL] Model not escaped: " << json << "\n";
            ++failures;
        }
        if (json.find("\"rtspUrl\":\"rtsp://10.0.0.10:554/axis-media/media.amp\"") == std::string::npos) {
            std::cerr << "[FAIL] RTSP URL: " << json << "\n";
            ++failures;
        }
    }

    // Test 10: worker pool delivers every result once and honours its bound
    {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        WorkerPool<int> pool(4, 8);
        int submitted = 0;
        int collected = 0;
        long long sum = 0;
        for (int i = 1; i <= 50; ++i) {
            bool ok = pool.submit([i, &running, &peak] {
                int now = ++running;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                --running;
                return i;
            });
            if (ok) ++submitted;
            while (auto r = pool.nextResult(0)) {
                sum += *r;
                ++collected;
            }
        }
        while (collected < submitted) {
            if (auto r = pool.nextResult(1000)) {
                sum += *r;
                ++collected;
            } else if (pool.inFlight() == 0) {
                break;
            }
        }
        if (collected != 50 || sum != 50 * 51 / 2) {
            std::cerr << "[FAIL] Worker pool delivered " << collected << " results\n";
            ++failures;
        }
        if (peak.load() > 4) {
            std::cerr << "[FAIL] Worker pool ran " << peak.load() << " tasks at once\n";
            ++failures;
        }
    }

    // Test 11: blocked local network access is announced once per process
    {
        if (!PermissionMonitor::isPermissionPattern(EACCES) || !PermissionMonitor::isPermissionPattern(EPERM) ||
            PermissionMonitor::isPermissionPattern(ECONNREFUSED) || PermissionMonitor::isPermissionPattern(ETIMEDOUT)) {
            std::cerr << "[FAIL] Permission errno classification\n";
            ++failures;
        }
        PermissionMonitor& monitor = PermissionMonitor::instance();
        monitor.reset();
        int notices = 0;
        std::string notice;
        monitor.setListener([&](const std::string& message) {
            ++notices;
            notice = message;
        });
        bool first = monitor.report(EACCES, "192.168.1.10");
        bool second = monitor.report(EACCES, "192.168.1.11");
        if (!first || second || notices != 1 || notice.empty() || !monitor.blocked()) {
            std::cerr << "[FAIL] Permission notice: first=" << first << " second=" << second
                      << " notices=" << notices << "\n";
            ++failures;
        }
        monitor.setListener(nullptr);
        monitor.reset();
        if (monitor.blocked() || !monitor.report(EPERM, "192.168.1.12")) {
            std::cerr << "[FAIL] Permission monitor reset\n";
            ++failures;
        }
        monitor.reset();
    }

    if (failures == 0) {
        std::cout << "ALL TESTS PASS\n";
        return 0;
    } else {
        std::cerr << failures << " test(s) failed\n";
        return 1;
    }
}
