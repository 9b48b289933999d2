/*
 * main.cpp  Andrew Belles  Nov 28th, 2025
 *
 * ctxpipe command line. Wires configuration, store, crawl runner,
 * extractor and retriever together:
 *
 *   ctxpipe [--config FILE] [--db PATH] [--log-level LEVEL] <command> ...
 *
 *   crawl   [--topic NAME]...                 crawl configured topics
 *   extract [--topic NAME]                    records from latest documents
 *   query   [--topic T] [--category C] [--max-items N] [--json] TEXT...
 *   history (--url URL | --key KEY)           every stored version
 *
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/json.hpp>

#include "ctxpipe/config.hpp"
#include "ctxpipe/crawler/crawler.hpp"
#include "ctxpipe/crawler/fetch.hpp"
#include "ctxpipe/crawler/json.hpp"
#include "ctxpipe/extract/extractor.hpp"
#include "ctxpipe/logging.hpp"
#include "ctxpipe/rank/retriever.hpp"
#include "ctxpipe/services/services.hpp"
#include "ctxpipe/store/content_store.hpp"

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_interrupted{false};

void
on_signal_(int)
{
  g_interrupted.store(true);
}

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/************ Options *************************************/
/* Global flags plus whatever the command left over
 */
struct Options {
  std::string config_path{};
  std::optional<std::string> db_path{};
  std::optional<std::string> log_level{};
  std::string command{};
  std::vector<std::string> args{};
};

Options
parse_options(int argc, char** argv)
{
  Options opt{};
  for (int i = 1; i < argc; i++) {
    const std::string arg = argv[i];
    auto value = [&](const char* flag) -> std::string {
      if ( i + 1 >= argc ) {
        throw UsageError(std::string(flag) + " needs a value");
      }
      return argv[++i];
    };

    if ( opt.command.empty() && arg == "--config" ) {
      opt.config_path = value("--config");
    } else if ( opt.command.empty() && arg == "--db" ) {
      opt.db_path = value("--db");
    } else if ( opt.command.empty() && arg == "--log-level" ) {
      opt.log_level = value("--log-level");
    } else if ( opt.command.empty() && arg.rfind("--", 0) == 0 ) {
      throw UsageError("unknown option " + arg);
    } else if ( opt.command.empty() ) {
      opt.command = arg;
    } else {
      opt.args.push_back(arg);
    }
  }

  if ( opt.command.empty() ) {
    throw UsageError("no command given");
  }
  return opt;
}

void
print_usage(std::ostream& os)
{
  os << "usage: ctxpipe [--config FILE] [--db PATH] [--log-level LEVEL] <command> ...\n"
        "  crawl   [--topic NAME]...\n"
        "  extract [--topic NAME]\n"
        "  query   [--topic T] [--category C] [--max-items N] [--json] TEXT...\n"
        "  history (--url URL | --key KEY)\n";
}

// prints e and every exception nested inside it, outermost first
void
print_nested(const std::exception& e, int depth = 0)
{
  lgr::get("cli")->error("{}{}", std::string(static_cast<size_t>(depth) * 2, ' '), e.what());
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& inner) {
    print_nested(inner, depth + 1);
  }
}

/************ crawl ***************************************/

int
run_crawl(const cfg::PipelineConfig& conf, dat::ContentStore& store,
          const std::vector<std::string>& args)
{
  std::vector<std::string> wanted;
  for (size_t i = 0; i < args.size(); i++) {
    if ( args[i] == "--topic" && i + 1 < args.size() ) {
      wanted.push_back(args[++i]);
    } else {
      throw UsageError("crawl: unexpected argument " + args[i]);
    }
  }

  std::vector<crwl::TopicSeed> jobs;
  if ( wanted.empty() ) {
    jobs = conf.topics;
  } else {
    for (const auto& name : wanted) {
      const auto* t = conf.find_topic(name);
      if ( !t ) {
        throw UsageError("crawl: topic '" + name + "' is not configured");
      }
      jobs.push_back(*t);
    }
  }
  if ( jobs.empty() ) {
    throw UsageError("crawl: no topics configured");
  }

  std::shared_ptr<crwl::RateLimiter> shared;
  if ( conf.rate_limit.shared ) {
    shared = std::make_shared<crwl::RateLimiter>(conf.rate_limit.min_delay, conf.rate_limit.scope);
  }

  crwl::DocumentSink sink = [&store](const dat::Document& doc) { store.put_document(doc); };
  auto factory = [&conf, shared, sink](const crwl::TopicSeed& job) {
    auto limiter = shared ? shared
                          : std::make_shared<crwl::RateLimiter>(conf.rate_limit.min_delay,
                                                                conf.rate_limit.scope);
    return std::make_unique<crwl::Frontier>(
      crwl::make_fetcher(job.policy.fetch_strategy, conf.fetch), std::move(limiter), sink);
  };

  crwl::Runner runner(factory, std::min(conf.workers, jobs.size()));
  runner.start();
  size_t queued = 0;
  for (auto& job : jobs) {
    if ( runner.enqueue(job) ) {
      queued++;
    } else {
      lgr::get("cli")->warn("crawl queue full, topic '{}' dropped", job.topic);
    }
  }
  runner.close();

  // jobs finish on their own, ctrl-c cancels between queue pops
  while ( runner.snapshot().processed < queued ) {
    if ( g_interrupted.load() ) {
      lgr::get("cli")->warn("interrupted, stopping crawl");
      runner.request_stop();
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  runner.join();

  const auto summary = runner.summary();
  std::cout << "topic\tfetched\taccepted\trejected\terrored\n";
  for (const auto& t : summary.topics) {
    std::cout << t.topic << '\t' << t.fetched << '\t' << t.accepted << '\t'
              << t.rejected << '\t' << t.errored << '\n';
  }
  return kExitOk;
}

/************ extract *************************************/

int
run_extract(const cfg::PipelineConfig& conf, dat::ContentStore& store,
            const std::vector<std::string>& args)
{
  std::optional<std::string> topic;
  for (size_t i = 0; i < args.size(); i++) {
    if ( args[i] == "--topic" && i + 1 < args.size() ) {
      topic = args[++i];
    } else {
      throw UsageError("extract: unexpected argument " + args[i]);
    }
  }

  auto assist = svc::make_assist(conf.services.assist);
  xtr::Extractor extractor(store, conf.extraction, assist.get());
  const auto summary = extractor.run(topic);

  std::cout << "processed " << summary.processed << ", extracted " << summary.extracted
            << ", skipped " << summary.skipped << ", errors " << summary.errors << '\n';
  return summary.errors == 0 ? kExitOk : kExitError;
}

/************ query ***************************************/

boost::json::object
bundle_json(const rnk::ContextBundle& bundle)
{
  boost::json::array items;
  for (const auto& item : bundle.items) {
    boost::json::object o;
    o["id"]         = item.candidate.id;
    o["provenance"] = std::string(rnk::to_string(item.candidate.provenance));
    o["topic"]      = item.candidate.topic;
    o["category"]   = item.candidate.category;
    o["title"]      = item.candidate.title;
    o["score"]      = item.score;
    o["sources"]    = jsc::to_array(item.candidate.source_urls);
    items.push_back(std::move(o));
  }

  boost::json::array citations;
  for (const auto& c : bundle.citations) {
    citations.push_back(boost::json::object{
      {"source_url", c.source_url},
      {"provenance", std::string(rnk::to_string(c.provenance))},
    });
  }

  boost::json::object out;
  out["items"]     = std::move(items);
  out["text"]      = bundle.text;
  out["citations"] = std::move(citations);
  return out;
}

int
run_query(const cfg::PipelineConfig& conf, dat::ContentStore& store,
          const std::vector<std::string>& args)
{
  std::optional<std::string> topic, category;
  size_t max_items = 0;
  bool as_json = false;
  std::string query;

  for (size_t i = 0; i < args.size(); i++) {
    const auto& a = args[i];
    if ( a == "--topic" && i + 1 < args.size() ) {
      topic = args[++i];
    } else if ( a == "--category" && i + 1 < args.size() ) {
      category = args[++i];
    } else if ( a == "--max-items" && i + 1 < args.size() ) {
      const auto& n = args[++i];
      char* end = nullptr;
      const long parsed = std::strtol(n.c_str(), &end, 10);
      if ( n.empty() || *end != '\0' || parsed <= 0 ) {
        throw UsageError("query: --max-items needs a positive integer");
      }
      max_items = static_cast<size_t>(parsed);
    } else if ( a == "--json" ) {
      as_json = true;
    } else {
      query += (query.empty() ? "" : " ") + a;
    }
  }
  if ( query.empty() ) {
    throw UsageError("query: no query text");
  }

  auto embedder = svc::make_embedding(conf.services.embedding);
  auto reranker = svc::make_rerank(conf.services.rerank);
  rnk::Retriever retriever(store, conf.retrieval, embedder.get(), reranker.get());

  const auto bundle = retriever.retrieve(query, topic, category, max_items);
  if ( as_json ) {
    std::cout << boost::json::serialize(bundle_json(bundle)) << '\n';
    return kExitOk;
  }

  if ( bundle.empty() ) {
    std::cout << "No relevant information found.\n";
    return kExitOk;
  }
  std::cout << bundle.text << "\n\nCitations:\n";
  for (const auto& c : bundle.citations) {
    std::cout << "  " << c.source_url << " (" << rnk::to_string(c.provenance) << ")\n";
  }
  return kExitOk;
}

/************ history *************************************/

int
run_history(dat::ContentStore& store, const std::vector<std::string>& args)
{
  std::optional<std::string> url, key;
  for (size_t i = 0; i < args.size(); i++) {
    if ( args[i] == "--url" && i + 1 < args.size() ) {
      url = args[++i];
    } else if ( args[i] == "--key" && i + 1 < args.size() ) {
      key = args[++i];
    } else {
      throw UsageError("history: unexpected argument " + args[i]);
    }
  }
  if ( url.has_value() == key.has_value() ) {
    throw UsageError("history: give exactly one of --url or --key");
  }

  if ( url ) {
    const auto docs = store.document_history(htc::normalize_url(*url));
    for (const auto& d : docs) {
      std::cout << 'v' << d.version << (d.is_latest ? " *" : "  ") << '\t'
                << d.fetched_at << '\t' << d.title << '\n';
    }
    return docs.empty() ? kExitError : kExitOk;
  }

  const auto recs = store.record_history(*key);
  for (const auto& r : recs) {
    std::cout << 'v' << r.version << (r.is_latest ? " *" : "  ") << '\t'
              << r.updated_at << '\t' << boost::json::serialize(r.fields) << '\t'
              << r.source_urls.size() << " source(s)\n";
  }
  return recs.empty() ? kExitError : kExitOk;
}

}

int
main(int argc, char** argv)
{
  Options opt;
  try {
    opt = parse_options(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << "ctxpipe: " << e.what() << '\n';
    print_usage(std::cerr);
    return kExitUsage;
  }

  if ( opt.command == "help" ) {
    print_usage(std::cout);
    return kExitOk;
  }

  std::signal(SIGINT, on_signal_);
  std::signal(SIGTERM, on_signal_);

  try {
    cfg::PipelineConfig conf = opt.config_path.empty() ? cfg::PipelineConfig{}
                                                       : cfg::load_config(opt.config_path);
    if ( opt.db_path ) {
      conf.store_path = *opt.db_path;
    }
    if ( opt.log_level ) {
      conf.logging.level = *opt.log_level;
    }
    lgr::init(conf.logging);

    dat::ContentStore store(conf.store_path);

    if ( opt.command == "crawl" ) {
      return run_crawl(conf, store, opt.args);
    }
    if ( opt.command == "extract" ) {
      return run_extract(conf, store, opt.args);
    }
    if ( opt.command == "query" ) {
      return run_query(conf, store, opt.args);
    }
    if ( opt.command == "history" ) {
      return run_history(store, opt.args);
    }
    throw UsageError("unknown command " + opt.command);
  } catch (const UsageError& e) {
    std::cerr << "ctxpipe: " << e.what() << '\n';
    print_usage(std::cerr);
    return kExitUsage;
  } catch (const std::exception& e) {
    print_nested(e);
    return kExitError;
  }
}
