#ifndef FEDMETA_FEDMETA_CONTROLLER_STORE_STORE_H_
#define FEDMETA_FEDMETA_CONTROLLER_STORE_STORE_H_

#include "fedmeta/controller/store/artifact_store.h"
#include "fedmeta/controller/store/file/file_artifact_store.h"
#include "fedmeta/controller/store/hash_map/hash_map_artifact_store.h"

#endif  // FEDMETA_FEDMETA_CONTROLLER_STORE_STORE_H_
