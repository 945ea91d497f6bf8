//
// Concatenates a session's chunks into one durable artifact
//

#ifndef DOCCONV_SERVER_ASSEMBLER_H
#define DOCCONV_SERVER_ASSEMBLER_H

#include "ArtifactRegistry.h"
#include "ChunkStore.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class Assembler {
public:
    Assembler(std::shared_ptr<ChunkStore> chunkStore, std::shared_ptr<ArtifactRegistry> registry);

    // Assembles the chunks of uploadId in index order, registers the artifact and returns its registry key.
    // Each session can be assembled exactly once, later calls fail with eSessionStateError.
    auto assemble(const std::string& uploadId, const std::string& filename) -> std::string;

    static auto makeRegistryKey(const std::string& uploadId, const std::string& filename) -> std::string;

private:
    static void concatenate(const std::vector<std::filesystem::path>& chunks, const std::filesystem::path& output);
    void purgeChunks(const std::string& uploadId, const std::vector<std::filesystem::path>& chunks);

    std::shared_ptr<ChunkStore> chunkStore;
    std::shared_ptr<ArtifactRegistry> registry;
};

#endif //DOCCONV_SERVER_ASSEMBLER_H
