#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ragvix/corpus/chunk_corpus.hpp"
#include "ragvix/corpus/chunker.hpp"
#include "ragvix/corpus/document.hpp"

#include <string>
#include <vector>

namespace {

namespace corpus = ragvix::corpus;

corpus::Document make_document(const std::string &id, const std::string &text) {
  corpus::Document document;
  document.id = id;
  document.text = text;
  return document;
}

std::vector<std::string> texts_of(const std::vector<corpus::Chunk> &chunks) {
  std::vector<std::string> out;
  out.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    out.push_back(chunk.text);
  }
  return out;
}

// Rebuilds the source text from character chunks by dropping each chunk's overlap prefix.
std::string stitch(const std::vector<corpus::Chunk> &chunks) {
  std::string out;
  std::uint64_t covered = 0;
  for (const auto &chunk : chunks) {
    const std::uint64_t skip = covered - chunk.start_offset;
    out += chunk.text.substr(static_cast<std::size_t>(skip));
    covered = chunk.end_offset;
  }
  return out;
}

} // namespace

void register_corpus_tests(std::vector<ragvix::tests::TestCase> &tests) {
  using ragvix::tests::require;
  namespace common = ragvix::common;
  using ragvix::testing::TempWorkspace;

  tests.push_back({"chunker_token_windows_match_worked_example", [] {
                     const auto result = corpus::chunk_document(
                         make_document("doc", "A B C D E F"),
                         corpus::ChunkingOptions{.window_size = 3,
                                                 .overlap = 1,
                                                 .unit = corpus::ChunkUnit::Tokens});
                     require(result.ok(), result.error());
                     const auto &chunks = result.value();
                     require(texts_of(chunks) ==
                                 std::vector<std::string>{"A B C", "C D E", "E F"},
                             "unexpected chunk texts");
                     for (std::size_t i = 0; i < chunks.size(); ++i) {
                       require(chunks[i].sequence_index == i, "sequence index");
                       require(chunks[i].document_id == "doc", "document id");
                     }
                     require(chunks[1].chunk_id == "doc#00001", "chunk id format");
                     require(chunks[1].start_offset == 2 && chunks[1].end_offset == 5,
                             "token offsets");
                   }});

  tests.push_back({"chunker_character_windows_tile_text", [] {
                     const std::string text = "abcdefghijklmnopqrstuvwxyz0123456789";
                     const auto result = corpus::chunk_document(
                         make_document("d", text),
                         corpus::ChunkingOptions{.window_size = 10, .overlap = 3});
                     require(result.ok(), result.error());
                     const auto &chunks = result.value();
                     require(chunks.front().start_offset == 0, "first chunk starts at 0");
                     require(chunks.back().end_offset == text.size(), "last chunk ends at L");
                     for (std::size_t i = 0; i < chunks.size(); ++i) {
                       require(chunks[i].end_offset - chunks[i].start_offset <= 10,
                               "window bound");
                       if (i > 0) {
                         require(chunks[i - 1].end_offset - chunks[i].start_offset == 3,
                                 "consecutive overlap must equal configured overlap");
                       }
                     }
                     require(stitch(chunks) == text, "de-overlapped chunks should rebuild text");
                   }});

  tests.push_back({"chunker_short_and_empty_documents", [] {
                     const corpus::ChunkingOptions options{.window_size = 50, .overlap = 5};
                     const auto short_doc =
                         corpus::chunk_document(make_document("s", "tiny"), options);
                     require(short_doc.ok(), short_doc.error());
                     require(short_doc.value().size() == 1, "short document gives one chunk");
                     require(short_doc.value()[0].text == "tiny", "whole text");

                     const auto empty = corpus::chunk_document(make_document("e", ""), options);
                     require(empty.ok(), "empty document is not an error");
                     require(empty.value().empty(), "empty document gives no chunks");
                   }});

  tests.push_back({"chunker_rejects_invalid_window", [] {
                     const auto doc = make_document("x", "some text");
                     const auto equal = corpus::chunk_document(
                         doc, corpus::ChunkingOptions{.window_size = 4, .overlap = 4});
                     require(!equal.ok(), "overlap == window should fail");
                     require(equal.code() == common::ErrorCode::InvalidConfiguration,
                             "expected InvalidConfiguration");
                     const auto zero = corpus::chunk_document(
                         doc, corpus::ChunkingOptions{.window_size = 0, .overlap = 0});
                     require(zero.code() == common::ErrorCode::InvalidConfiguration,
                             "zero window should fail");
                   }});

  tests.push_back({"chunker_counts_code_points_not_bytes", [] {
                     // Four code points, eight bytes.
                     const std::string text = "\xC3\xA9\xC3\xA8\xC3\xAA\xC3\xAB";
                     const auto result = corpus::chunk_document(
                         make_document("u", text),
                         corpus::ChunkingOptions{.window_size = 2, .overlap = 0});
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "two windows of two code points");
                     require(result.value()[0].text == "\xC3\xA9\xC3\xA8", "no split sequence");
                     require(result.value()[1].end_offset == 4, "offsets in code points");
                   }});

  tests.push_back({"truncate_code_points_keeps_sequences_whole", [] {
                     // 'a' followed by 200 two-byte code points: byte 200 is mid-sequence.
                     std::string text = "a";
                     for (int i = 0; i < 200; ++i) {
                       text += "\xC3\xA9";
                     }
                     const std::string snippet = corpus::truncate_code_points(text, 200);
                     require(snippet.size() == 1 + 199 * 2, "199 whole code points after 'a'");
                     require((static_cast<unsigned char>(snippet.back()) & 0xC0) == 0x80 &&
                                 static_cast<unsigned char>(snippet[snippet.size() - 2]) == 0xC3,
                             "ends on a complete sequence");
                     require(corpus::truncate_code_points("\xF0\x9F\x93\x84 paper", 1) ==
                                 "\xF0\x9F\x93\x84",
                             "four-byte sequence kept whole");
                     require(corpus::truncate_code_points("short", 200) == "short", "no-op");
                     require(corpus::truncate_code_points("abc", 0).empty(), "zero budget");
                   }});

  tests.push_back({"chunker_is_deterministic", [] {
                     const auto doc = make_document("p", "The quick brown fox jumps over the "
                                                         "lazy dog again and again.");
                     const corpus::ChunkingOptions options{.window_size = 12, .overlap = 4};
                     const auto first = corpus::chunk_document(doc, options);
                     const auto second = corpus::chunk_document(doc, options);
                     require(first.ok() && second.ok(), "chunking should succeed");
                     require(first.value().size() == second.value().size(), "same count");
                     for (std::size_t i = 0; i < first.value().size(); ++i) {
                       require(first.value()[i].chunk_id == second.value()[i].chunk_id &&
                                   first.value()[i].text == second.value()[i].text,
                               "identical chunks");
                     }
                   }});

  tests.push_back({"chunk_unit_parsing", [] {
                     require(corpus::parse_chunk_unit("Tokens").value() == corpus::ChunkUnit::Tokens,
                             "tokens");
                     require(corpus::parse_chunk_unit("chars").value() == corpus::ChunkUnit::Chars,
                             "chars");
                     require(!corpus::parse_chunk_unit("words").ok(), "unknown unit");
                     require(corpus::chunk_unit_name(corpus::ChunkUnit::Tokens) == "tokens",
                             "unit name");
                   }});

  tests.push_back({"document_record_accepts_arxiv_fields", [] {
                     const auto parsed = corpus::parse_document_record(
                         R"({"arxiv_id": "2301.00001", "abstract": "We study \"things\".", )"
                         R"("title": "On Things", "authors": ["Ada", "Alan"], )"
                         R"("categories": ["cs.IR", "cs.CL"], "published": "2023-01-02"})");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.id == "2301.00001", "id from arxiv_id");
                     require(doc.text == "We study \"things\".", "text from abstract");
                     require(doc.info.title == "On Things", "title");
                     require(doc.info.authors.size() == 2, "authors");
                     require(doc.info.category == "cs.IR", "first category");
                     require(doc.info.published == "2023-01-02", "published");
                   }});

  tests.push_back({"read_documents_skips_bad_records", [] {
                     TempWorkspace workspace;
                     workspace.create_file("docs.jsonl",
                                           "{\"id\": \"a\", \"text\": \"alpha text\"}\n"
                                           "not json\n"
                                           "\n"
                                           "{\"id\": \"b\", \"text\": \"\"}\n"
                                           "{\"text\": \"no id\"}\n"
                                           "{\"id\": \"c\", \"text\": \"gamma text\"}\n");
                     const auto docs = corpus::read_documents(workspace.path() / "docs.jsonl");
                     require(docs.ok(), docs.error());
                     require(docs.value().size() == 2, "only a and c survive");
                     require(docs.value()[1].id == "c", "order kept");

                     const auto missing = corpus::read_documents(workspace.path() / "none.jsonl");
                     require(missing.code() == common::ErrorCode::IoError, "missing file");
                   }});

  tests.push_back({"chunk_corpus_round_trip_keeps_metadata", [] {
                     TempWorkspace workspace;
                     corpus::Document doc = make_document("d1", "line one\nline \"two\"");
                     doc.info.title = "Title";
                     doc.info.authors = {"A. Author"};
                     doc.info.category = "cs.IR";
                     doc.info.published = "2024-05-01";
                     const auto chunks = corpus::chunk_document(
                         doc, corpus::ChunkingOptions{.window_size = 8, .overlap = 2});
                     require(chunks.ok(), chunks.error());

                     const corpus::ChunkCorpus written{
                         .chunks = chunks.value(),
                         .documents = corpus::collect_document_info({doc})};
                     const auto path = workspace.path() / "out" / "chunks.jsonl";
                     require(corpus::write_chunk_corpus(path, written).ok(), "write corpus");

                     const auto read = corpus::read_chunk_corpus(path);
                     require(read.ok(), read.error());
                     require(read.value().chunks.size() == written.chunks.size(), "chunk count");
                     for (std::size_t i = 0; i < written.chunks.size(); ++i) {
                       const auto &a = written.chunks[i];
                       const auto &b = read.value().chunks[i];
                       require(a.chunk_id == b.chunk_id && a.text == b.text &&
                                   a.start_offset == b.start_offset &&
                                   a.end_offset == b.end_offset &&
                                   a.sequence_index == b.sequence_index,
                               "chunk " + a.chunk_id + " differs after round trip");
                     }
                     const auto &info = read.value().documents.at("d1");
                     require(info.title == "Title" && info.category == "cs.IR", "metadata");
                     require(info.authors == std::vector<std::string>{"A. Author"}, "authors");
                   }});

  tests.push_back({"chunk_corpus_reports_bad_line_number", [] {
                     TempWorkspace workspace;
                     workspace.create_file(
                         "chunks.jsonl",
                         "{\"chunk_id\":\"a#00000\",\"document_id\":\"a\",\"sequence_index\":0,"
                         "\"start_offset\":0,\"end_offset\":3,\"text\":\"abc\"}\n"
                         "{\"chunk_id\":\"a#00001\",\"document_id\":\"a\",\"sequence_index\":-1,"
                         "\"start_offset\":0,\"end_offset\":3,\"text\":\"abc\"}\n");
                     const auto read = corpus::read_chunk_corpus(workspace.path() / "chunks.jsonl");
                     require(!read.ok(), "negative index should fail");
                     require(read.code() == common::ErrorCode::InvalidArgument,
                             "expected InvalidArgument");
                     require(read.error().find(":2:") != std::string::npos,
                             "error should name line 2: " + read.error());
                   }});
}
