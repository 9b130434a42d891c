#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>
#include "application/LexicalRetriever.hpp"
#include "application/SemanticRetriever.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "TestDoubles.hpp"

using namespace agentrouter;

namespace {

domain::Document MakeDoc(const std::string& id, const std::string& title, const std::string& body) {
    domain::Document doc;
    doc.id = id;
    doc.title = title;
    doc.bodyText = body;
    doc.sourceUrl = "https://www.service-public.fr/professionnels-entreprises/vosdroits/" + id;
    doc.sizeChars = body.size();
    return doc;
}

std::vector<domain::Document> SampleCorpus() {
    return {
        MakeDoc("F23567", "La TVA", "La TVA est un impôt indirect sur la consommation. La TVA collectée est reversée à l'État."),
        MakeDoc("F31200", "Cotisations URSSAF", "Les cotisations sociales du dirigeant sont calculées sur le revenu professionnel."),
        MakeDoc("F2329", "Bulletin de paie", "Le bulletin de paie doit comporter des mentions obligatoires."),
        MakeDoc("F23547", "Cotisation foncière des entreprises", "La CFE est due dans chaque commune où l'entreprise dispose de locaux.")
    };
}

void TestCosineProperties() {
    std::cout << "[Test] Cosine similarity is symmetric and bounded..." << std::endl;
    std::vector<std::vector<float>> vectors = {
        {1.0f, 2.0f, 3.0f}, {-1.0f, 0.5f, 2.0f}, {3.0f, 0.0f, -1.0f}, {0.2f, 0.2f, 0.2f}, {-1.0f, -2.0f, -3.0f}
    };
    for (const auto& a : vectors) {
        for (const auto& b : vectors) {
            float ab = application::CosineSimilarity(a, b);
            float ba = application::CosineSimilarity(b, a);
            assert(ab == ba);
            assert(ab >= 0.0f && ab <= 1.0f);
        }
        assert(std::fabs(application::CosineSimilarity(a, a) - 1.0f) < 1e-6f);
    }
    std::vector<float> zero(3, 0.0f);
    assert(application::CosineSimilarity(vectors[0], zero) == 0.0f);
    assert(application::CosineSimilarity(zero, zero) == 0.0f);
    assert(application::CosineSimilarity({1.0f, 2.0f}, {1.0f, 2.0f, 3.0f}) == 0.0f);
    assert(application::CosineSimilarity(vectors[0], vectors[4]) == 0.0f); // opposite vectors clamp to 0
    std::cout << "[PASS] Cosine properties" << std::endl;
}

void TestTvaQuery() {
    std::cout << "[Test] \"C'est quoi la TVA ?\" finds the TVA document..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    auto cache = std::make_shared<infrastructure::EmbeddingCache>(provider);
    application::SemanticRetriever retriever(cache);

    auto results = retriever.retrieve("C'est quoi la TVA ?", SampleCorpus());
    assert(!results.empty());
    assert(results.size() <= 3);
    assert(results[0].document.title == "La TVA");
    assert(results[0].score >= 0.3f);
    for (std::size_t i = 1; i < results.size(); ++i) {
        assert(results[i - 1].score >= results[i].score);
    }
    std::cout << "[PASS] TVA query" << std::endl;
}

void TestBoundsAndThreshold() {
    std::cout << "[Test] Results respect k and minScore..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    auto cache = std::make_shared<infrastructure::EmbeddingCache>(provider);
    application::SemanticRetriever retriever(cache);
    auto corpus = SampleCorpus();

    for (std::size_t k : {0u, 1u, 2u, 10u}) {
        for (float minScore : {0.0f, 0.1f, 0.3f, 0.9f}) {
            auto results = retriever.retrieve("cotisations de la TVA et de la CFE", corpus, k, minScore);
            assert(results.size() <= k);
            for (const auto& r : results) {
                assert(r.score >= minScore);
                assert(r.score <= 1.0f);
            }
        }
    }
    std::cout << "[PASS] Bounds" << std::endl;
}

void TestStableTies() {
    std::cout << "[Test] Equal scores keep corpus order..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    auto cache = std::make_shared<infrastructure::EmbeddingCache>(provider);
    application::SemanticRetriever retriever(cache);

    std::vector<domain::Document> corpus = {
        MakeDoc("B", "Même titre", "Même contenu."),
        MakeDoc("A", "Même titre", "Même contenu."),
        MakeDoc("C", "Même titre", "Même contenu.")
    };
    auto results = retriever.retrieve("même titre", corpus, 3, 0.0f);
    assert(results.size() == 3);
    assert(results[0].document.id == "B");
    assert(results[1].document.id == "A");
    assert(results[2].document.id == "C");
    std::cout << "[PASS] Stable ties" << std::endl;
}

void TestEmbeddingFailures() {
    std::cout << "[Test] A failing document is skipped, a failing query yields nothing..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    auto cache = std::make_shared<infrastructure::EmbeddingCache>(provider);
    application::SemanticRetriever retriever(cache);
    auto corpus = SampleCorpus();

    provider->failContaining = {"La TVA La TVA"};
    auto results = retriever.retrieve("La TVA et la CFE", corpus, 4, 0.0f);
    for (const auto& r : results) assert(r.document.id != "F23567");
    bool sawCfe = false;
    for (const auto& r : results) sawCfe = sawCfe || r.document.id == "F23547";
    assert(sawCfe);

    provider->failContaining.clear();
    provider->failOn = {"question en panne"};
    assert(!retriever.tryRetrieve("question en panne", corpus, 3, 0.0f).has_value());
    assert(retriever.retrieve("question en panne", corpus, 3, 0.0f).empty());
    std::cout << "[PASS] Embedding failures" << std::endl;
}

void TestWeightedRepresentation() {
    std::cout << "[Test] Representation repeats the title and caps the body..." << std::endl;
    application::SemanticRetriever retriever(nullptr);
    auto doc = MakeDoc("X", "La TVA", std::string(1500, 'z'));
    std::string rep = retriever.weightedRepresentation(doc);
    assert(rep == "La TVA La TVA La TVA " + std::string(1000, 'z'));
    std::cout << "[PASS] Weighted representation" << std::endl;
}

void TestPrecomputedEmbedding() {
    std::cout << "[Test] Ingestion embeddings of the right size are used as-is..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    auto cache = std::make_shared<infrastructure::EmbeddingCache>(provider);
    application::SemanticRetriever retriever(cache);

    auto doc = MakeDoc("P", "Sans rapport", "Rien à voir.");
    doc.embedding = provider->embed("licenciement économique");
    provider->calls = 0;

    auto results = retriever.retrieve("licenciement économique", {doc}, 1, 0.9f);
    assert(results.size() == 1);
    assert(provider->calls == 1); // only the query
    std::cout << "[PASS] Precomputed embedding" << std::endl;
}

void TestLexicalFallback() {
    std::cout << "[Test] Keyword retrieval ranks by title and body hits..." << std::endl;
    application::LexicalRetriever lexical;
    auto keywords = lexical.extractKeywords("Comment déclarer la TVA sur mes ventes ?");
    assert(keywords.size() == 3);
    assert(keywords[0] == "déclarer");
    assert(keywords[1] == "tva");
    assert(keywords[2] == "ventes");

    auto results = lexical.retrieve("la TVA", SampleCorpus(), 3, 0.0f);
    assert(!results.empty());
    assert(results[0].document.id == "F23567");
    assert(results[0].score == 1.0f);

    assert(lexical.retrieve("le la les", SampleCorpus(), 3, 0.0f).empty());
    std::cout << "[PASS] Lexical retrieval" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SemanticRetriever tests..." << std::endl;
    TestCosineProperties();
    TestTvaQuery();
    TestBoundsAndThreshold();
    TestStableTies();
    TestEmbeddingFailures();
    TestWeightedRepresentation();
    TestPrecomputedEmbedding();
    TestLexicalFallback();
    std::cout << "[PASS] SemanticRetriever tests completed." << std::endl;
    return 0;
}
