#pragma once

// Режим генерации файла условий в папке tests
void runGenerateMode();
