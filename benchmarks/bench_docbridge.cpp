#include <benchmark/benchmark.h>
#include "document/document_writer.h"
#include "query/query_compiler.h"
#include "query/query_executor.h"
#include "storage/rocksdb_document_store.h"
#include <filesystem>
#include <stdexcept>

using namespace docbridge;
using nlohmann::json;

namespace {
    SchemaDefinition userSchema() {
        SchemaDefinition s;
        s.type_name = "User";
        s.ns = "user";
        s.primary_key = "id";
        s.fields = {{"email", FieldType::String}, {"age", FieldType::Integer}, {"city", FieldType::String}};
        s.constraints.unique.push_back(UniqueConstraint{"email-index", {}});
        return s;
    }

    void cleanupTestDB(const std::string& path) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
}

// --- Compile (rein, ohne Store) ---

static void BM_CompileSelector(benchmark::State& state) {
    auto schema = userSchema();
    query::QueryRequest req;
    req.where = query::Predicate::and_({
        query::Predicate::cmp(">", "age", 18),
        query::Predicate::or_({
            query::Predicate::eq("city", "Berlin"),
            query::Predicate::eq("city", query::Placeholder{0})
        })
    });
    req.params = {json("Hamburg")};
    for (auto _ : state) {
        auto r = query::QueryCompiler::compile(schema, req);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CompileSelector)->Unit(benchmark::kMicrosecond);

class WriterFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State&) override {
        db_path_ = "bench_docbridge_db";
        cleanupTestDB(db_path_);

        RocksDBDocumentStore::Config config;
        config.db_path = db_path_;
        config.compression = "lz4";
        store_ = std::make_unique<RocksDBDocumentStore>(config);
        if (!store_->open()) throw std::runtime_error("cannot open " + db_path_);
        schema_ = userSchema();

        // Warmup: 1000 Dokumente
        for (size_t i = 0; i < 1000; ++i) {
            auto out = document::DocumentWriter::insert(*store_, schema_,
                {{"id", std::to_string(i)}, {"email", "u" + std::to_string(i) + "@x.com"},
                 {"age", static_cast<int64_t>(i % 80)}, {"city", i % 2 ? "Berlin" : "Hamburg"}}, {});
            if (!out.ok()) throw std::runtime_error("warmup insert failed: " + out.error);
        }
        counter_ = 1000;
    }

    void TearDown(const ::benchmark::State&) override {
        store_.reset();
        cleanupTestDB(db_path_);
    }

protected:
    std::string db_path_;
    std::unique_ptr<RocksDBDocumentStore> store_;
    SchemaDefinition schema_;
    size_t counter_ = 0;
};

// --- Write Benchmarks ---

BENCHMARK_DEFINE_F(WriterFixture, InsertWithUniqueMarker)(benchmark::State& state) {
    for (auto _ : state) {
        size_t i = counter_++;
        auto out = document::DocumentWriter::insert(*store_, schema_,
            {{"id", std::to_string(i)}, {"email", "u" + std::to_string(i) + "@x.com"}}, {"id"});
        if (!out.ok()) { state.SkipWithError(out.error.c_str()); return; }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(WriterFixture, InsertWithUniqueMarker)->Unit(benchmark::kMicrosecond);

// --- Read Benchmarks ---

BENCHMARK_DEFINE_F(WriterFixture, PointGet)(benchmark::State& state) {
    query::QueryRequest req;
    req.where = query::Predicate::eq("id", "42");
    for (auto _ : state) {
        auto r = query::QueryExecutor::all(*store_, schema_, req);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(WriterFixture, PointGet)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(WriterFixture, RangeScanPage)(benchmark::State& state) {
    query::QueryRequest req;
    req.limit = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        auto r = query::QueryExecutor::all(*store_, schema_, req);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(WriterFixture, RangeScanPage)->Arg(10)->Arg(100)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(WriterFixture, SelectorFullScan)(benchmark::State& state) {
    query::QueryRequest req;
    req.where = query::Predicate::cmp(">=", "age", 70);
    req.limit = 50;
    for (auto _ : state) {
        auto r = query::QueryExecutor::all(*store_, schema_, req);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(WriterFixture, SelectorFullScan)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
