#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include "domain/Document.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DocumentCorpus.hpp"
#include "infrastructure/DocumentParser.hpp"
#include "infrastructure/FileSystemDocumentStore.hpp"
#include "TestDoubles.hpp"

using namespace agentrouter;
using Clock = infrastructure::DocumentCorpus::Clock;

namespace {

struct ManualClock {
    Clock::time_point now = Clock::time_point(std::chrono::hours(1));
    infrastructure::DocumentCorpus::ClockFn fn() {
        return [this] { return now; };
    }
};

void TestTtlSnapshot() {
    std::cout << "[Test] Snapshot is reused within the TTL and refetched after..." << std::endl;
    auto store = std::make_shared<test::MemoryDocumentStore>();
    store->addDocument("fiscal/F23570.json", "La TVA", "La TVA est un impôt indirect.",
                       "https://www.service-public.fr/professionnels-entreprises/vosdroits/F23570");
    ManualClock clock;
    infrastructure::DocumentCorpus corpus(store, {std::chrono::seconds(3600), ""}, clock.fn());

    auto first = corpus.load();
    assert(first->size() == 1);
    assert((*first)[0].id == "F23570");
    assert((*first)[0].sizeChars == std::string("La TVA est un impôt indirect.").size());

    clock.now += std::chrono::seconds(3599);
    auto second = corpus.load();
    assert(store->listCalls == 1);
    assert(second.get() == first.get());

    store->addDocument("fiscal/F31200.json", "Impôt sur les sociétés", "L'IS concerne les bénéfices.",
                       "https://www.service-public.fr/professionnels-entreprises/vosdroits/F31200");
    clock.now += std::chrono::seconds(1);
    auto third = corpus.load();
    assert(store->listCalls == 2);
    assert(third->size() == 2);
    // Readers holding the old snapshot still see it whole.
    assert(first->size() == 1);
    std::cout << "[PASS] TTL snapshot" << std::endl;
}

void TestStaleOnFailure() {
    std::cout << "[Test] Refetch failure serves the stale snapshot..." << std::endl;
    auto store = std::make_shared<test::MemoryDocumentStore>();
    store->addDocument("a.json", "Bulletin de paie", "Mentions obligatoires du bulletin.", "https://example.org/paie/F559");
    ManualClock clock;
    infrastructure::DocumentCorpus corpus(store, {std::chrono::seconds(60), ""}, clock.fn());

    assert(corpus.load()->size() == 1);
    store->failing = true;
    clock.now += std::chrono::seconds(61);
    assert(corpus.load()->size() == 1);
    assert(!corpus.refresh());
    assert(corpus.current()->size() == 1);

    // Timestamp was not advanced by the failure: the next load retries.
    int before = store->listCalls;
    corpus.load();
    assert(store->listCalls == before + 1);

    store->failing = false;
    assert(corpus.refresh());
    std::cout << "[PASS] Stale serving" << std::endl;
}

void TestEmptyWhenNeverLoaded() {
    std::cout << "[Test] Failure without any snapshot yields an empty corpus..." << std::endl;
    auto store = std::make_shared<test::MemoryDocumentStore>();
    store->failing = true;
    infrastructure::DocumentCorpus corpus(store);
    auto snapshot = corpus.load();
    assert(snapshot != nullptr);
    assert(snapshot->empty());
    std::cout << "[PASS] Empty corpus" << std::endl;
}

void TestParsingAndDuplicates() {
    std::cout << "[Test] Malformed objects are skipped and duplicate ids dropped..." << std::endl;
    auto store = std::make_shared<test::MemoryDocumentStore>();
    store->addDocument("1.json", "CFE", "Cotisation foncière des entreprises.", "https://example.org/vosdroits/F23547");
    store->addDocument("2.json", "CFE (copie)", "Doublon.", "https://example.org/autre/F23547");
    store->objects.push_back({"3.json", "{not json"});
    store->objects.push_back({"4.json", R"({"titre": "Sans contenu", "source_url": "https://example.org/x"})"});
    store->objects.push_back({"5.json", R"({"title": "English keys", "content": "Body.", "url": "https://example.org/docs/guide.html", "embedding": [0.1, 0.2]})"});

    infrastructure::DocumentCorpus corpus(store);
    auto docs = corpus.load();
    assert(docs->size() == 2);
    assert((*docs)[0].title == "CFE");
    assert((*docs)[1].id == "guide");
    assert((*docs)[1].embedding.has_value());
    assert((*docs)[1].embedding->size() == 2);

    assert(domain::DeriveDocumentId("https://example.org/") == domain::DeriveDocumentId("https://example.org/"));
    assert(domain::DeriveDocumentId("https://example.org/").size() == 8);
    assert(domain::DeriveDocumentId("https://example.org/a/F123?x=1#top") == "F123");
    std::cout << "[PASS] Parsing and duplicates" << std::endl;
}

void TestFileSystemStore() {
    std::cout << "[Test] FileSystemDocumentStore lists JSON files under a prefix..." << std::endl;
    namespace fs = std::filesystem;
    fs::path root = fs::temp_directory_path() / "agentrouter_store_test";
    fs::remove_all(root);
    fs::create_directories(root / "fiscal");
    fs::create_directories(root / "social");
    std::ofstream(root / "fiscal" / "tva.json") << R"({"titre":"La TVA","contenu":"Taux normal 20 %.","source_url":"https://example.org/F23567"})";
    std::ofstream(root / "fiscal" / "notes.txt") << "ignored";
    std::ofstream(root / "social" / "paie.json") << R"({"titre":"Paie","contenu":"Bulletin.","source_url":"https://example.org/F559"})";

    infrastructure::FileSystemDocumentStore store(root.string());
    assert(store.listDocuments("").size() == 2);
    auto fiscal = store.listDocuments("fiscal");
    assert(fiscal.size() == 1);
    assert(infrastructure::DocumentParser::Parse(fiscal[0])->title == "La TVA");

    infrastructure::FileSystemDocumentStore missing((root / "absent").string());
    bool threw = false;
    try {
        missing.listDocuments("");
    } catch (const domain::CorpusUnavailableError&) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(root);
    std::cout << "[PASS] FileSystemDocumentStore" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentCorpus tests..." << std::endl;
    TestTtlSnapshot();
    TestStaleOnFailure();
    TestEmptyWhenNeverLoaded();
    TestParsingAndDuplicates();
    TestFileSystemStore();
    std::cout << "[PASS] DocumentCorpus tests completed." << std::endl;
    return 0;
}
