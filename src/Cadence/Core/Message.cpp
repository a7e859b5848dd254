#include "Message.h"

#include "Helper/String.h"

Metadata::Metadata(std::string_view type_path, std::string_view path_leaf)
    : PathLeaf(path_leaf),
      Path(TypePath{type_path} / PathLeaf),
      Name(StringHelper::PascalToSentenceCase(path_leaf)) {}
