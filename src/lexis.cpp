/*
 * The MIT License (MIT)
 *
 * Copyright (c) 2025 Yaroslav Riabtsev <yaroslav.riabtsev@rwth-aachen.de>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NON-INFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "lexis.hpp"
#include "content.hpp"
#include "key_value_store.hpp"
#include "logging.hpp"
#include "prompts.hpp"

namespace lexispace {
namespace {
    std::shared_ptr<key_value_store>
    durable_store(const std::filesystem::path& dir) {
        if (dir.empty()) {
            return nullptr;
        }
        return std::make_shared<file_store>(dir);
    }

    std::shared_ptr<const content_source>
    dataset(const std::filesystem::path& path, const bool substring) {
        if (path.empty()) {
            return nullptr;
        }
        auto loaded = std::make_shared<const static_dataset>(
            static_dataset::load(path, {}, substring)
        );
        corespace::logger()->info(
            "loaded {} entries from {}", loaded->size(), path.string()
        );
        return loaded;
    }

    const lexis_options& configure_logging(const lexis_options& opt) {
        corespace::set_log_level(opt.log_level);
        return opt;
    }

    prompt_fn prompt_of(
        std::string (*render)(std::string_view, std::string_view, std::string_view)
    ) {
        return [render](const stage_request& request) {
            return render(request.query, request.lang, request.native_lang);
        };
    }
}

lexis::lexis(lexis_options opt)
    : lexis(
          opt, std::make_unique<corespace::http_client>(opt.network)
      ) { }

lexis::lexis(lexis_options opt, std::unique_ptr<corespace::transport> link)
    : opt(configure_logging(opt))
    , link(std::move(link))
    , client(*this->link, this->opt.backend)
    , poller(client, this->opt.poll)
    , store(durable_store(this->opt.storage_dir), this->opt.cache)
    , words(
          basic_stage(client, prompt_of(basic_info_prompt)), detail_stage(),
          this->opt.orchestrator
      )
    , word_chain(
          store, dedup,
          chain_sources {
              .local = dataset(this->opt.dictionary_path, false),
              .fallback = dataset(this->opt.fallback_path, true),
              .remote =
                  [this](
                      const chain_request& request,
                      const progress_callback& report, std::stop_token stop
                  ) {
                      return words.fetch(
                          { request.query, request.lang, request.native_lang },
                          report, stop
                      );
                  },
              .available = availability(),
              .enrich = {},
              .usable = usable_word_detail,
          }
      )
    , suggestion_chain(
          store, dedup,
          chain_sources {
              .local = nullptr,
              .fallback = nullptr,
              .remote = streaming_suggestions_remote(client),
              .available = availability(),
              .enrich = usage_hint_enricher(client, store),
              .usable = usable_suggestions,
          }
      )
    , translation_chain(
          store, dedup,
          chain_sources {
              .local = nullptr,
              .fallback = nullptr,
              .remote =
                  [this](
                      const chain_request& request, const progress_callback&,
                      std::stop_token
                  ) {
                      return nlohmann::json(client.translate(
                          request.query, request.lang, request.native_lang
                      ));
                  },
              .available = availability(),
              .enrich = {},
              .usable = usable_translation,
          }
      ) { }

stage_fn lexis::detail_stage() {
    if (opt.orchestrator.mode == detail_mode::streaming) {
        return streaming_detail_stage(
            client, prompt_of(additional_details_prompt),
            opt.orchestrator.basic_share
        );
    }
    return polling_detail_stage(poller, prompt_of(dictionary_prompt));
}

std::function<bool()> lexis::availability() {
    return [this] { return client.configured(); };
}

chain_outcome lexis::word_detail(
    const std::string& query, const std::string& lang,
    const progress_callback& on_progress, const std::stop_token stop
) {
    return word_chain.resolve({ query, lang, "ja", {} }, on_progress, stop);
}

chain_outcome lexis::suggestions(
    const std::string& query, const std::string& lang, item_sink on_item,
    const std::stop_token stop
) {
    return suggestion_chain.resolve(
        { query, lang, "ja", "suggest" }, forward_new_items(std::move(on_item)),
        stop
    );
}

chain_outcome lexis::translate(
    const std::string& text, const std::string& source_lang,
    const std::string& target_lang, const std::stop_token stop
) {
    check_translation_input(text);
    return translation_chain.resolve(
        { text, source_lang, target_lang, "translate>" + target_lang }, {},
        stop
    );
}

void lexis::wait_background() {
    suggestion_chain.wait_enrichment();
    word_chain.wait_enrichment();
    store.flush();
}

result_cache& lexis::cache() noexcept { return store; }

const lexis_options& lexis::options() const noexcept { return opt; }
}
