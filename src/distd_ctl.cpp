#include "distd/chunker.hpp"
#include "distd/cid_utils.hpp"
#include "distd/config.hpp"
#include "distd/diff.hpp"
#include "distd/engine.hpp"
#include "distd/errors.hpp"
#include "distd/logger.h"
#include "distd/merkle_tree.hpp"
#include "distd/selftest.h"
#include "distd/var_dir.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

static distd::HashTree treeOfFile(const std::string &file, size_t chunkSize) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    distd::throwNotFound("Cannot open " + file);
  }
  distd::Chunker chunker(in, chunkSize);
  distd::TreeBuilder builder;
  distd::Chunk chunk;
  while (chunker.next(chunk)) {
    builder.addChunk(chunk.data);
  }
  if (builder.leafCount() == 0)
    return distd::MerkleTree::emptyTree();
  return builder.finish();
}

static int hash_command(const std::string &file,
                        const distd::DistdConfig &cfg) {
  distd::HashTree tree = treeOfFile(file, cfg.chunkSize);
  std::cout << "root   " << distd::toHex(tree.rootHash()) << '\n'
            << "cid    " << distd::digestToCid(tree.rootHash()) << '\n'
            << "size   " << tree.totalSize() << '\n'
            << "chunks " << tree.leafCount() << '\n'
            << "depth  " << tree.depth() << std::endl;
  return 0;
}

static int ingest_command(const std::string &itemPath, const std::string &file,
                          const distd::DistdConfig &cfg) {
  distd::DistributionEngine engine(cfg);
  distd::IngestResult res = engine.ingestFile(itemPath, file);
  auto stats = engine.store().stats();
  std::cout << res.path << " v" << res.version << ' '
            << distd::toHex(res.tree->rootHash()) << '\n'
            << "store: " << stats.liveChunks << " live chunks, "
            << stats.storedBytes << " bytes (" << engine.store().backend().name()
            << ")" << std::endl;
  return 0;
}

static int diff_command(const std::string &oldFile, const std::string &newFile,
                        const distd::DistdConfig &cfg) {
  distd::HashTree oldTree = treeOfFile(oldFile, cfg.chunkSize);
  distd::HashTree newTree = treeOfFile(newFile, cfg.chunkSize);
  distd::HashSet known(oldTree.leaves().size());
  for (const auto &leaf : oldTree.leaves())
    known.insert(leaf.hash);
  distd::TransferPlan plan =
      distd::planTransfer(newTree, known, oldTree.rootHash());
  if (plan.upToDate()) {
    std::cout << "up to date" << std::endl;
    return 0;
  }
  for (const auto &e : plan.entries()) {
    std::cout << e.index << '\t' << e.leaf.offset << '\t' << e.leaf.size
              << '\t' << distd::toHex(e.leaf.hash) << '\n';
  }
  std::cout << plan.size() << " of " << newTree.leafCount()
            << " chunks missing, " << plan.missingBytes() << " bytes"
            << std::endl;
  return 0;
}

static int gc_command(bool dryRun, const distd::DistdConfig &cfg) {
  distd::DistributionEngine engine(cfg);
  auto stats = engine.store().collectGarbage(dryRun);
  std::cout << stats.reclaimableChunks << '/' << stats.totalChunks
            << " chunks reclaimable, " << stats.freedBytes << " bytes freed"
            << std::endl;
  return 0;
}

static void usage() {
  std::cout << "Usage: distd_ctl hash <file>\n"
            << "       distd_ctl ingest <item_path> <file>\n"
            << "       distd_ctl diff <old_file> <new_file>\n"
            << "       distd_ctl gc [--dry-run]\n"
            << "       distd_ctl selftest\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  try {
    distd::DistdConfig cfg = distd::loadConfig(distd::configPath());
    std::filesystem::create_directories(
        std::filesystem::path(cfg.logFile).parent_path());
    Logger::init(cfg.logFile, cfg.logLevel, cfg.logMaxSize, cfg.logMaxBackups);

    if (cmd == "hash" && argc >= 3)
      return hash_command(argv[2], cfg);
    if (cmd == "ingest" && argc >= 4)
      return ingest_command(argv[2], argv[3], cfg);
    if (cmd == "diff" && argc >= 4)
      return diff_command(argv[2], argv[3], cfg);
    if (cmd == "gc")
      return gc_command(argc >= 3 && std::string(argv[2]) == "--dry-run", cfg);
    if (cmd == "selftest") {
      bool ok = distd::hash_self_test();
      std::cout << (ok ? "Self test passed" : "Self test FAILED") << std::endl;
      return ok ? 0 : 1;
    }
  } catch (const distd::DistdError &e) {
    std::cerr << distd::errorKindToString(e.kind()) << ": " << e.what()
              << std::endl;
    return distd::isRetryable(e.kind()) ? 75 : 2;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "IOFailure: " << e.what() << std::endl;
    return 75;
  }
  usage();
  return 1;
}
