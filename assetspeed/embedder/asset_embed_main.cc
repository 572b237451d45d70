/*
 * Copyright 2016 Google Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Embeds the assets an HTML file references, read from a local directory,
// and writes the rewritten document.

#include <cstdio>
#include <cstdlib>
#include <map>

#include "assetspeed/embedder/public/asset_embedder.h"
#include "assetspeed/embedder/public/asset_profiler.h"
#include "assetspeed/embedder/public/asset_reference_extractor.h"
#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/embedder/public/embedding_reporter.h"
#include "assetspeed/kernel/base/google_message_handler.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/null_thread_system.h"
#include "assetspeed/kernel/base/proto_util.h"
#include "assetspeed/kernel/base/stdio_file_system.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/string_writer.h"
#include "assetspeed/kernel/html/html_parse.h"
#include "assetspeed/kernel/util/gflags.h"
#include "assetspeed/kernel/util/simple_stats.h"
#include "assetspeed/opt/logging/embedding_log.pb.h"

DEFINE_string(html, "", "HTML file to rewrite.");
DEFINE_string(asset_root, ".",
              "Directory that asset paths in the document are relative to.");
DEFINE_string(output, "-", "Where to write the rewritten HTML; - for stdout.");
DEFINE_int64(inline_threshold,
             assetspeed::EmbeddingOptions::kDefaultInlineThreshold,
             "Largest asset, in bytes, inlined when no kind-specific "
             "threshold applies.");
DEFINE_int64(image_inline_threshold,
             assetspeed::EmbeddingOptions::kDefaultImageInlineThreshold,
             "Largest image, in bytes, inlined as a data: URL.");
DEFINE_int64(font_inline_threshold,
             assetspeed::EmbeddingOptions::kDefaultFontInlineThreshold,
             "Largest font, in bytes, inlined as a data: URL.");
DEFINE_bool(modern_transport, false,
            "Optimize for a multiplexed transport, scaling thresholds down.");
DEFINE_bool(inline_data_uris, true, "Inline small assets as data: URLs.");
DEFINE_bool(inline_vectors, true, "Inline SVG images as markup.");
DEFINE_bool(respect_cache_hints, true,
            "Only delegate assets whose type is conventionally long-cached.");
DEFINE_bool(delegate_uploads, false,
            "Route large single-use assets to the upload location.");
DEFINE_string(upload_base_url, "", "Base URL of the upload location.");
DEFINE_string(upload_path_template,
              assetspeed::EmbeddingOptions::kDefaultUploadPathTemplate,
              "Path appended to --upload_base_url; {filename} is replaced by "
              "the asset's file name.");
DEFINE_string(options, "",
              "Comma-separated Name=value option settings, applied last.");
DEFINE_bool(analyze_only, false,
            "Print an asset summary instead of rewriting the document.");
DEFINE_bool(quick, false,
            "Start from the quick preset: modern transport with data: URL "
            "and vector inlining.");
DEFINE_string(log_format, "text",
              "How to print the embedding log: text or none.");

namespace assetspeed {

namespace {

const char kUsage[] =
    "Usage: asset_embed --html=page.html [--asset_root=dir] "
    "[--output=out.html] [options]";

typedef std::map<GoogleString, GoogleString> AssetBufferMap;

bool BuildOptions(EmbeddingOptions* options, MessageHandler* handler) {
  *options = FLAGS_quick ? EmbeddingOptions::QuickPreset() : EmbeddingOptions();
  if (WasFlagSet("inline_threshold")) {
    options->inline_threshold = FLAGS_inline_threshold;
  }
  if (WasFlagSet("image_inline_threshold")) {
    options->image_inline_threshold = FLAGS_image_inline_threshold;
  }
  if (WasFlagSet("font_inline_threshold")) {
    options->font_inline_threshold = FLAGS_font_inline_threshold;
  }
  if (WasFlagSet("modern_transport")) {
    options->optimize_for_modern_transport = FLAGS_modern_transport;
  }
  if (WasFlagSet("inline_data_uris")) {
    options->inline_data_uris = FLAGS_inline_data_uris;
  }
  if (WasFlagSet("inline_vectors")) {
    options->inline_vectors = FLAGS_inline_vectors;
  }
  if (WasFlagSet("respect_cache_hints")) {
    options->respect_cache_hints = FLAGS_respect_cache_hints;
  }
  if (WasFlagSet("delegate_uploads")) {
    options->delegate_uploads = FLAGS_delegate_uploads;
  }
  options->upload_base_url = FLAGS_upload_base_url;
  options->upload_path_template = FLAGS_upload_path_template;

  StringPieceVector settings;
  SplitStringPieceToVector(FLAGS_options, ",", &settings, true);
  StringStringMap overrides;
  for (int i = 0, n = settings.size(); i < n; ++i) {
    StringPiece setting = settings[i];
    size_t equals = setting.find('=');
    if (equals == StringPiece::npos) {
      handler->Message(kError, "--options: expected Name=value, got '%s'",
                       setting.as_string().c_str());
      return false;
    }
    StringPiece name = setting.substr(0, equals);
    TrimWhitespace(&name);
    overrides[name.as_string()] = setting.substr(equals + 1).as_string();
  }
  GoogleString msg;
  if (!options->Merge(overrides, &msg)) {
    handler->Message(kError, "--options: %s", msg.c_str());
    return false;
  }
  return true;
}

// Maps a path as written in the document to a file under asset_root.
// Returns false for paths that can't be local files.
bool AssetFilename(StringPiece path, GoogleString* filename) {
  size_t end = path.find_first_of("?#");
  if (end != StringPiece::npos) {
    path = path.substr(0, end);
  }
  if (path.empty() || path.find("://") != StringPiece::npos ||
      path.starts_with("//")) {
    return false;
  }
  while (path.starts_with("./")) {
    path.remove_prefix(2);
  }
  while (path.starts_with("/")) {
    path.remove_prefix(1);
  }
  *filename = StrCat(FLAGS_asset_root, "/", path);
  return true;
}

// Reads every referenced asset that exists under --asset_root.
void LoadAssets(const GoogleString& html, StdioFileSystem* file_system,
                MessageHandler* handler, AssetBufferMap* buffers,
                AssetContentMap* assets) {
  HtmlParse html_parse(handler);
  AssetReferenceVector references;
  AssetReferenceExtractor extractor(&html_parse, &references);
  html_parse.StartParse(FLAGS_html);
  html_parse.ParseText(html);
  html_parse.FinishParse();
  html_parse.ApplyFilter(&extractor);

  for (int i = 0, n = references.size(); i < n; ++i) {
    const GoogleString& path = references[i].path;
    GoogleString filename;
    if (buffers->find(path) != buffers->end() ||
        !AssetFilename(path, &filename) ||
        !file_system->Exists(filename.c_str())) {
      continue;
    }
    GoogleString* buffer = &(*buffers)[path];
    if (!file_system->ReadFile(filename.c_str(), buffer, handler)) {
      buffers->erase(path);
    }
  }
  for (AssetBufferMap::const_iterator p = buffers->begin(),
           e = buffers->end(); p != e; ++p) {
    (*assets)[p->first] = p->second;
  }
}

void PrintSummary(const AssetSummary& summary, const AssetProfileMap& profiles,
                  GoogleString* out) {
  StrAppend(out, "Assets: ", IntegerToString(summary.total_assets), "\n");
  StrAppend(out, "Total size: ", FormatBytes(summary.total_size), "\n");
  StrAppend(out, "Average size: ", FormatBytes(summary.average_size), "\n");
  for (StringIntMap::const_iterator p = summary.count_by_kind.begin(),
           e = summary.count_by_kind.end(); p != e; ++p) {
    StrAppend(out, "  ", p->first, ": ");
    StrAppend(out, IntegerToString(p->second), "\n");
  }
  for (AssetProfileMap::const_iterator p = profiles.begin(),
           e = profiles.end(); p != e; ++p) {
    const AssetProfile& profile = p->second;
    StrAppend(out, profile.path, " ", FormatBytes(profile.size));
    StrAppend(out, " used ", IntegerToString(profile.usage_count), "x",
              profile.critical ? " critical" : "");
    StrAppend(out, " -> ", PreliminaryActionName(profile.recommended_action));
    StrAppend(out, " (", profile.recommended_reason, ")\n");
  }
}

bool AssetEmbed_main(int argc, char** argv) {
  GoogleMessageHandler handler;
  StdioFileSystem file_system;

  if (FLAGS_html.empty()) {
    handler.Message(kError, "%s", kUsage);
    return false;
  }
  if (FLAGS_log_format != "text" && FLAGS_log_format != "none") {
    handler.Message(kError, "--log_format must be text or none, not %s",
                    FLAGS_log_format.c_str());
    return false;
  }

  EmbeddingOptions options;
  if (!BuildOptions(&options, &handler)) {
    return false;
  }
  handler.Message(kInfo, "Options: %s", options.ToString().c_str());

  GoogleString html;
  if (!file_system.ReadFile(FLAGS_html.c_str(), &html, &handler)) {
    return false;
  }
  AssetBufferMap buffers;
  AssetContentMap assets;
  LoadAssets(html, &file_system, &handler, &buffers, &assets);

  NullThreadSystem thread_system;
  SimpleStats stats(&thread_system);
  AssetEmbedder::InitStats(&stats);
  AssetEmbedder embedder(options, &handler, &stats);

  if (FLAGS_analyze_only) {
    AssetProfileMap profiles;
    AssetSummary summary;
    embedder.Analyze(FLAGS_html, html, assets, &profiles, &summary);
    GoogleString out;
    PrintSummary(summary, profiles, &out);
    return file_system.WriteFile(FLAGS_output.c_str(), out, &handler);
  }

  EmbeddingResult result;
  if (!embedder.Embed(FLAGS_html, html, assets, &result)) {
    return false;
  }
  if (!file_system.WriteFile(FLAGS_output.c_str(), result.html, &handler)) {
    return false;
  }

  if (FLAGS_log_format == "text") {
    EmbeddingLog log;
    EmbeddingReporter::PopulateLog(FLAGS_html, result.decisions,
                                   result.report, &log);
    GoogleString text;
    if (!PrintTextFormatProtoToString(log, &text)) {
      handler.Message(kError, "Could not format the embedding log");
      return false;
    }
    handler.Message(kInfo, "Embedding log:\n%s", text.c_str());

    GoogleString dump;
    StringWriter writer(&dump);
    if (!stats.Dump(&writer, &handler)) {
      return false;
    }
    handler.Message(kInfo, "Statistics:\n%s", dump.c_str());
  }
  return true;
}

}  // namespace

}  // namespace assetspeed

int main(int argc, char** argv) {
  assetspeed::ParseGflags(argv[0], assetspeed::kUsage, &argc, &argv);
  return assetspeed::AssetEmbed_main(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE;
}
